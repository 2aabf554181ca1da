#pragma once

#ifdef __cplusplus

#include "invoker.hpp"
#include "type_registry.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quarry {

// ============================================================================
// property_metadata - readable/writable properties of one described type
// ============================================================================

/// Built once per type from its accessor methods (getX/isX/setX) and fields,
/// including everything inherited through registered supertypes. Immutable
/// after construction.
class property_metadata {
public:
    property_metadata(const meta_type& type, bool allow_private_access);

    property_metadata(const property_metadata&) = delete;
    property_metadata& operator=(const property_metadata&) = delete;

    const meta_type& type() const { return type_; }

    bool has_default_constructor() const { return default_constructor_ != nullptr; }

    /// Throws construction_error if the type has no accessible zero-argument constructor.
    const constructor_desc& default_constructor() const;

    const invoker& get_invoker(const std::string& property) const;
    const invoker& set_invoker(const std::string& property) const;

    const meta_type& getter_type(const std::string& property) const;
    const meta_type& setter_type(const std::string& property) const;

    const std::vector<std::string>& getable_property_names() const { return readable_names_; }
    const std::vector<std::string>& setable_property_names() const { return writable_names_; }

    bool has_getter(const std::string& property) const { return get_invokers_.count(property) > 0; }
    bool has_setter(const std::string& property) const { return set_invokers_.count(property) > 0; }

    /// Canonical property name for a case-insensitive lookup.
    std::optional<std::string> find_property_name(const std::string& name) const;

private:
    struct discovered_method {
        const method_desc* method;
        address_adjust adjust;
    };
    struct discovered_field {
        const field_desc* field;
        address_adjust adjust;
    };

    bool accessible(member_access access) const;
    void collect_methods(const meta_type& type, const address_adjust& adjust,
                         std::unordered_set<std::string>& seen,
                         std::vector<discovered_method>& out) const;
    void collect_fields(const meta_type& type, const address_adjust& adjust,
                        std::vector<discovered_field>& out) const;

    void add_default_constructor();
    void add_get_methods(const std::vector<discovered_method>& methods);
    void add_set_methods(const std::vector<discovered_method>& methods);
    void add_fields(const std::vector<discovered_field>& fields);

    void resolve_getter_conflicts(const std::map<std::string, std::vector<const discovered_method*>>& conflicting);
    void resolve_setter_conflicts(const std::map<std::string, std::vector<const discovered_method*>>& conflicting);
    const discovered_method* pick_better_setter(const discovered_method* first, const discovered_method* second,
                                                const std::string& property);

    void add_get_method(const std::string& name, const discovered_method& method);
    void add_set_method(const std::string& name, const discovered_method& method);

    static bool is_valid_property_name(const std::string& name);

    const meta_type& type_;
    bool allow_private_access_;
    const constructor_desc* default_constructor_ = nullptr;

    std::vector<std::string> readable_names_;
    std::vector<std::string> writable_names_;
    std::map<std::string, std::unique_ptr<invoker>> get_invokers_;
    std::map<std::string, std::unique_ptr<invoker>> set_invokers_;
    std::map<std::string, const meta_type*> get_types_;
    std::map<std::string, const meta_type*> set_types_;
    std::unordered_map<std::string, std::string> case_insensitive_names_;
};

} // namespace quarry

#endif // __cplusplus
