#include "quarry/log.hpp"
#include "quarry/errors.hpp"

#include <cstdarg>

namespace quarry {

std::atomic<log_level> g_log_level{log_level::off};

log_level parse_log_level(const std::string& name) {
    for (auto level : {log_level::off, log_level::error, log_level::warn, log_level::info, log_level::debug}) {
        if (name == log_level_name(level)) {
            return level;
        }
    }
    throw config_error("Unknown log level '" + name + "', expected off, error, warn, info or debug");
}

const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "unknown";
}

void log_write(log_level level, const char* tag, const char* fmt, ...) {
    char message[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    std::fprintf(stderr, "quarry %s [%s] %s\n", log_level_name(level), tag, message);
}

} // namespace quarry
