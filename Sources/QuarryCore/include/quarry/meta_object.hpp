#pragma once

#ifdef __cplusplus

#include "metadata_registry.hpp"
#include "statement.hpp"
#include <any>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quarry {

/// Property access on one object by name. Paths may be dotted ("author.name").
/// Objects are described types (held by value or std::shared_ptr) or param_map.
/// The wrapped any is referenced, not copied: writes land in the caller's object.
class meta_object {
public:
    meta_object(std::any& object, metadata_registry& registry);

    const std::any& original_object() const { return object_; }

    bool is_null() const { return target_ == nullptr && !is_map_; }
    bool is_map() const { return is_map_; }

    std::any get_value(const std::string& path) const;
    void set_value(const std::string& path, const std::any& value);

    bool has_getter(const std::string& path) const;
    bool has_setter(const std::string& path) const;

    /// Canonical (case-correct) dotted path for `name`, if every segment resolves.
    std::optional<std::string> find_property(const std::string& name) const;

    std::vector<std::string> getter_names() const;
    std::vector<std::string> setter_names() const;

    const meta_type& getter_type(const std::string& path) const;
    const meta_type& setter_type(const std::string& path) const;

private:
    std::any get_property(const std::string& name) const;
    void set_property(const std::string& name, const std::any& value);
    std::any instantiate_property(const std::string& name);

    std::any& object_;
    metadata_registry& registry_;
    const meta_type* holder_type_ = nullptr;  // descriptor of the any's content
    const meta_type* type_ = nullptr;         // described object type (handles unwrapped)
    void* target_ = nullptr;
    bool is_map_ = false;
    std::shared_ptr<const property_metadata> metadata_;
};

/// Value bound for `property` of a statement: an additional parameter of `sql`
/// first, else null without a parameter object, else the parameter itself when
/// it is a scalar, else the parameter's property.
std::any resolve_parameter_value(const bound_sql& sql, const std::string& property,
                                 std::any& parameter, metadata_registry& registry);

} // namespace quarry

#endif // __cplusplus
