#include "quarry/property_namer.hpp"
#include "quarry/errors.hpp"

#include <cctype>

namespace quarry {
namespace property_namer {

namespace {
    bool starts_with(const std::string& s, const char* prefix, size_t len) {
        return s.size() > len && s.compare(0, len, prefix) == 0;
    }
}

std::string method_to_property(const std::string& name) {
    std::string property;
    if (name.size() > 2 && name.compare(0, 2, "is") == 0) {
        property = name.substr(2);
    } else if (name.size() > 3 && (name.compare(0, 3, "get") == 0 || name.compare(0, 3, "set") == 0)) {
        property = name.substr(3);
    } else {
        throw reflection_error("Error parsing property name '" + name +
                               "'.  Didn't start with 'is', 'get' or 'set'.");
    }

    if (property.size() == 1 ||
        (property.size() > 1 && !std::isupper(static_cast<unsigned char>(property[1])))) {
        property[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(property[0])));
    }
    return property;
}

bool is_property(const std::string& name) {
    return is_getter(name) || is_setter(name);
}

bool is_getter(const std::string& name) {
    return starts_with(name, "get", 3) || starts_with(name, "is", 2);
}

bool is_setter(const std::string& name) {
    return starts_with(name, "set", 3);
}

} // namespace property_namer
} // namespace quarry
