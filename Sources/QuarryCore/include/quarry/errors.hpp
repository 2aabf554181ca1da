#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace quarry {

/// Base of every error raised by quarry itself.
class quarry_error : public std::runtime_error {
public:
    explicit quarry_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Store-access failure raised by the SQLite layer or any statement runner.
class db_error : public quarry_error {
public:
    explicit db_error(const std::string& msg) : quarry_error(msg) {}
};

/// Misuse of the executor (unresolvable deferred loads, bad extraction).
class executor_error : public quarry_error {
public:
    explicit executor_error(const std::string& msg) : quarry_error(msg) {}
};

/// Operation attempted on a closed executor.
class executor_closed_error : public executor_error {
public:
    explicit executor_closed_error(const std::string& msg = "Executor was closed.")
        : executor_error(msg) {}
};

/// Metadata conflicts and other type-shape defects found while reflecting a type.
class reflection_error : public quarry_error {
public:
    explicit reflection_error(const std::string& msg) : quarry_error(msg) {}
};

/// A type cannot be instantiated because it has no usable default constructor.
class construction_error : public reflection_error {
public:
    explicit construction_error(const std::string& msg) : reflection_error(msg) {}
};

/// No resolved getter or setter exists for the requested property name.
class property_not_found_error : public reflection_error {
public:
    explicit property_not_found_error(const std::string& msg) : reflection_error(msg) {}
};

/// Invalid settings or statement registry misuse.
class config_error : public quarry_error {
public:
    explicit config_error(const std::string& msg) : quarry_error(msg) {}
};

} // namespace quarry

#endif // __cplusplus
