#include "quarry/property_metadata.hpp"
#include "quarry/log.hpp"
#include "quarry/property_namer.hpp"

#include <algorithm>
#include <cctype>

namespace quarry {

namespace {
    address_adjust compose(const address_adjust& outer, const address_adjust& inner) {
        if (!outer) return inner;
        if (!inner) return outer;
        return [outer, inner](void* p) { return inner(outer(p)); };
    }

    std::string to_upper(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }
}

property_metadata::property_metadata(const meta_type& type, bool allow_private_access)
    : type_(type), allow_private_access_(allow_private_access) {
    std::vector<discovered_method> methods;
    std::unordered_set<std::string> seen;
    collect_methods(type_, address_adjust{}, seen, methods);

    std::vector<discovered_field> fields;
    collect_fields(type_, address_adjust{}, fields);

    add_default_constructor();
    add_get_methods(methods);
    add_set_methods(methods);
    add_fields(fields);

    for (const auto& [name, _] : get_invokers_) {
        readable_names_.push_back(name);
    }
    for (const auto& [name, _] : set_invokers_) {
        writable_names_.push_back(name);
    }
    for (const auto& name : readable_names_) {
        case_insensitive_names_[to_upper(name)] = name;
    }
    for (const auto& name : writable_names_) {
        case_insensitive_names_[to_upper(name)] = name;
    }

    LOG_DEBUG("reflect", "Built metadata for %s: %zu readable, %zu writable",
              type_.name().c_str(), readable_names_.size(), writable_names_.size());
}

bool property_metadata::accessible(member_access access) const {
    return access == member_access::public_access || allow_private_access_;
}

// ============================================================================
// Discovery
// ============================================================================

void property_metadata::collect_methods(const meta_type& type, const address_adjust& adjust,
                                        std::unordered_set<std::string>& seen,
                                        std::vector<discovered_method>& out) const {
    for (const auto& method : type.methods()) {
        if (!accessible(method.access)) {
            continue;
        }
        // The most derived declaration of a signature wins.
        if (seen.insert(method.signature()).second) {
            out.push_back({&method, adjust});
        }
    }
    for (const auto& link : type.supertypes()) {
        collect_methods(*link.type, compose(adjust, link.adjust), seen, out);
    }
}

void property_metadata::collect_fields(const meta_type& type, const address_adjust& adjust,
                                       std::vector<discovered_field>& out) const {
    for (const auto& field : type.fields()) {
        if (accessible(field.access)) {
            out.push_back({&field, adjust});
        }
    }
    for (const auto& link : type.supertypes()) {
        collect_fields(*link.type, compose(adjust, link.adjust), out);
    }
}

void property_metadata::add_default_constructor() {
    for (const auto& ctor : type_.constructors()) {
        if (ctor.param_types.empty() && accessible(ctor.access)) {
            default_constructor_ = &ctor;
            return;
        }
    }
}

// ============================================================================
// Getters
// ============================================================================

void property_metadata::add_get_methods(const std::vector<discovered_method>& methods) {
    std::map<std::string, std::vector<const discovered_method*>> conflicting;
    for (const auto& m : methods) {
        if (m.method->param_types.empty() && property_namer::is_getter(m.method->name)) {
            std::string property = property_namer::method_to_property(m.method->name);
            if (is_valid_property_name(property)) {
                conflicting[property].push_back(&m);
            }
        }
    }
    resolve_getter_conflicts(conflicting);
}

void property_metadata::resolve_getter_conflicts(
        const std::map<std::string, std::vector<const discovered_method*>>& conflicting) {
    for (const auto& [property, candidates] : conflicting) {
        const discovered_method* winner = nullptr;
        for (const discovered_method* candidate : candidates) {
            if (winner == nullptr) {
                winner = candidate;
                continue;
            }
            const meta_type& winner_type = *winner->method->return_type;
            const meta_type& candidate_type = *candidate->method->return_type;
            if (&candidate_type == &winner_type) {
                throw reflection_error("Illegal overloaded getter method with ambiguous type for property " +
                                       property + " in class " + winner->method->declaring_type->name() +
                                       ". This breaks the accessor naming conventions and can cause unpredictable results.");
            } else if (candidate_type.is_assignable_from(winner_type)) {
                // current getter is the more specific one
            } else if (winner_type.is_assignable_from(candidate_type)) {
                winner = candidate;
            } else {
                throw reflection_error("Illegal overloaded getter method with ambiguous type for property " +
                                       property + " in class " + winner->method->declaring_type->name() +
                                       ". This breaks the accessor naming conventions and can cause unpredictable results.");
            }
        }
        add_get_method(property, *winner);
    }
}

void property_metadata::add_get_method(const std::string& name, const discovered_method& method) {
    get_invokers_[name] = std::make_unique<method_invoker>(*method.method, method.adjust);
    get_types_[name] = method.method->return_type;
}

// ============================================================================
// Setters
// ============================================================================

void property_metadata::add_set_methods(const std::vector<discovered_method>& methods) {
    std::map<std::string, std::vector<const discovered_method*>> conflicting;
    for (const auto& m : methods) {
        if (m.method->param_types.size() == 1 && property_namer::is_setter(m.method->name)) {
            std::string property = property_namer::method_to_property(m.method->name);
            if (is_valid_property_name(property)) {
                conflicting[property].push_back(&m);
            }
        }
    }
    resolve_setter_conflicts(conflicting);
}

void property_metadata::resolve_setter_conflicts(
        const std::map<std::string, std::vector<const discovered_method*>>& conflicting) {
    for (const auto& [property, setters] : conflicting) {
        auto getter = get_types_.find(property);
        const meta_type* getter_type = getter == get_types_.end() ? nullptr : getter->second;

        const discovered_method* match = nullptr;
        std::optional<reflection_error> conflict;
        for (const discovered_method* setter : setters) {
            if (setter->method->param_types.front() == getter_type) {
                match = setter;
                break;
            }
            if (!conflict) {
                try {
                    match = pick_better_setter(match, setter, property);
                } catch (const reflection_error& e) {
                    // an exact getter-type match may still follow
                    match = nullptr;
                    conflict = e;
                }
            }
        }
        if (match == nullptr) {
            throw *conflict;
        }
        add_set_method(property, *match);
    }
}

const property_metadata::discovered_method* property_metadata::pick_better_setter(
        const discovered_method* first, const discovered_method* second, const std::string& property) {
    if (first == nullptr) {
        return second;
    }
    const meta_type& first_type = *first->method->param_types.front();
    const meta_type& second_type = *second->method->param_types.front();
    if (first_type.is_assignable_from(second_type)) {
        return second;
    }
    if (second_type.is_assignable_from(first_type)) {
        return first;
    }
    throw reflection_error("Ambiguous setters defined for property '" + property + "' in class '" +
                           second->method->declaring_type->name() + "' with types '" +
                           first_type.name() + "' and '" + second_type.name() + "'.");
}

void property_metadata::add_set_method(const std::string& name, const discovered_method& method) {
    set_invokers_[name] = std::make_unique<method_invoker>(*method.method, method.adjust);
    set_types_[name] = method.method->param_types.front();
}

// ============================================================================
// Fields
// ============================================================================

void property_metadata::add_fields(const std::vector<discovered_field>& fields) {
    for (const auto& f : fields) {
        const field_desc& field = *f.field;
        if (!is_valid_property_name(field.name)) {
            continue;
        }
        if (set_invokers_.count(field.name) == 0 && !(field.is_final && field.is_static)) {
            set_invokers_[field.name] = std::make_unique<set_field_invoker>(field, f.adjust);
            set_types_[field.name] = field.type;
        }
        if (get_invokers_.count(field.name) == 0) {
            get_invokers_[field.name] = std::make_unique<get_field_invoker>(field, f.adjust);
            get_types_[field.name] = field.type;
        }
    }
}

bool property_metadata::is_valid_property_name(const std::string& name) {
    return !(name.rfind('$', 0) == 0 || name == "serialVersionUID" || name == "class");
}

// ============================================================================
// Lookups
// ============================================================================

const constructor_desc& property_metadata::default_constructor() const {
    if (default_constructor_ == nullptr) {
        throw construction_error("There is no default constructor for " + type_.name());
    }
    return *default_constructor_;
}

const invoker& property_metadata::get_invoker(const std::string& property) const {
    auto it = get_invokers_.find(property);
    if (it == get_invokers_.end()) {
        throw property_not_found_error("There is no getter for property named '" + property + "' in '" +
                                       type_.name() + "'");
    }
    return *it->second;
}

const invoker& property_metadata::set_invoker(const std::string& property) const {
    auto it = set_invokers_.find(property);
    if (it == set_invokers_.end()) {
        throw property_not_found_error("There is no setter for property named '" + property + "' in '" +
                                       type_.name() + "'");
    }
    return *it->second;
}

const meta_type& property_metadata::getter_type(const std::string& property) const {
    auto it = get_types_.find(property);
    if (it == get_types_.end()) {
        throw property_not_found_error("There is no getter for property named '" + property + "' in '" +
                                       type_.name() + "'");
    }
    return *it->second;
}

const meta_type& property_metadata::setter_type(const std::string& property) const {
    auto it = set_types_.find(property);
    if (it == set_types_.end()) {
        throw property_not_found_error("There is no setter for property named '" + property + "' in '" +
                                       type_.name() + "'");
    }
    return *it->second;
}

std::optional<std::string> property_metadata::find_property_name(const std::string& name) const {
    auto it = case_insensitive_names_.find(to_upper(name));
    if (it == case_insensitive_names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace quarry
