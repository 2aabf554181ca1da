#pragma once

#ifdef __cplusplus

#include <string>

namespace quarry {

/// Accessor-name conventions: getX / isX read property x, setX writes it.
namespace property_namer {

/// Property name for an accessor name ("getURL" -> "URL", "getA" -> "a").
/// Throws reflection_error when the name carries no accessor prefix.
std::string method_to_property(const std::string& name);

bool is_property(const std::string& name);
bool is_getter(const std::string& name);
bool is_setter(const std::string& name);

} // namespace property_namer

} // namespace quarry

#endif // __cplusplus
