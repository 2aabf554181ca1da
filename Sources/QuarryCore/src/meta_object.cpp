#include "quarry/meta_object.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace quarry {

namespace {
    std::pair<std::string, std::string> split_path(const std::string& path) {
        auto dot = path.find('.');
        if (dot == std::string::npos) {
            return {path, std::string()};
        }
        return {path.substr(0, dot), path.substr(dot + 1)};
    }

    const meta_type& unwrap(const meta_type& type) {
        return type.pointee() ? *type.pointee() : type;
    }

    bool is_dynamic(const type_registry& types, const meta_type& type) {
        return &type == &types.map_type() || type.is_object();
    }

    // Path lookups that only need declared types, not values.
    std::shared_ptr<const property_metadata> metadata_for_path(metadata_registry& registry,
                                                               const meta_type& root,
                                                               const std::string& path,
                                                               std::string& last) {
        auto meta = registry.find_for_type(unwrap(root));
        auto [head, rest] = split_path(path);
        while (!rest.empty()) {
            const meta_type& next = unwrap(meta->getter_type(head));
            if (is_dynamic(registry.types(), next)) {
                return nullptr;
            }
            if (next.is_scalar()) {
                throw property_not_found_error("There is no property named '" + rest + "' in '" + next.name() + "'");
            }
            meta = registry.find_for_type(next);
            std::tie(head, rest) = split_path(rest);
        }
        last = head;
        return meta;
    }
}

meta_object::meta_object(std::any& object, metadata_registry& registry)
    : object_(object), registry_(registry) {
    if (!object_.has_value()) {
        return;
    }
    const type_registry& types = registry_.types();
    holder_type_ = types.type_of(object_);
    if (holder_type_ == nullptr) {
        throw reflection_error("Type " + detail::demangle(object_.type().name()) +
                               " is not registered with the type registry");
    }
    if (&unwrap(*holder_type_) == &types.map_type()) {
        is_map_ = true;
        target_ = holder_type_->address_of(object_);
        return;
    }
    type_ = &unwrap(*holder_type_);
    target_ = holder_type_->address_of(object_);
    if (!type_->is_scalar()) {
        metadata_ = registry_.find_for_type(*type_);
    }
}

// ============================================================================
// Values
// ============================================================================

std::any meta_object::get_value(const std::string& path) const {
    if (is_null()) {
        return {};
    }
    auto [head, rest] = split_path(path);
    if (rest.empty()) {
        return get_property(head);
    }
    std::any child = get_property(head);
    if (registry_.types().is_null(child)) {
        return {};
    }
    return meta_object(child, registry_).get_value(rest);
}

void meta_object::set_value(const std::string& path, const std::any& value) {
    if (is_null()) {
        throw reflection_error("Cannot set property '" + path + "' on a null object");
    }
    auto [head, rest] = split_path(path);
    if (rest.empty()) {
        set_property(head, value);
        return;
    }
    std::any child = get_property(head);
    if (registry_.types().is_null(child)) {
        if (!value.has_value()) {
            return;
        }
        child = instantiate_property(head);
    }
    meta_object(child, registry_).set_value(rest, value);

    // Values held by copy have to be written back to the parent.
    const meta_type* child_type = registry_.types().type_of(child);
    if (child_type && !child_type->pointee()) {
        set_property(head, child);
    }
}

std::any meta_object::get_property(const std::string& name) const {
    if (is_map_) {
        const auto& map = *static_cast<const param_map*>(target_);
        auto it = map.find(name);
        return it == map.end() ? std::any() : it->second;
    }
    if (!metadata_) {
        throw property_not_found_error("There is no getter for property named '" + name + "' in '" +
                                       type_->name() + "'");
    }
    std::vector<std::any> args;
    return metadata_->get_invoker(name).invoke(target_, args);
}

void meta_object::set_property(const std::string& name, const std::any& value) {
    if (is_map_) {
        (*static_cast<param_map*>(target_))[name] = value;
        return;
    }
    if (!metadata_) {
        throw property_not_found_error("There is no setter for property named '" + name + "' in '" +
                                       type_->name() + "'");
    }
    const invoker& setter = metadata_->set_invoker(name);
    std::vector<std::any> args{registry_.types().convert(value, setter.type())};
    setter.invoke(target_, args);
}

std::any meta_object::instantiate_property(const std::string& name) {
    const type_registry& types = registry_.types();
    const meta_type& declared = is_map_ ? types.map_type() : metadata_->setter_type(name);

    std::any created;
    if (is_dynamic(types, declared)) {
        created = param_map{};
    } else if (declared.pointee()) {
        created = registry_.find_for_type(*declared.pointee())->default_constructor().create();
    } else {
        throw reflection_error("Cannot instantiate property '" + name + "' of type " + declared.name() +
                               ": only shared_ptr and map properties can be created on demand");
    }
    set_property(name, created);
    return created;
}

// ============================================================================
// Metadata
// ============================================================================

bool meta_object::has_getter(const std::string& path) const {
    if (is_map_) {
        auto [head, rest] = split_path(path);
        std::any child = get_property(head);
        if (rest.empty()) {
            return static_cast<const param_map*>(target_)->count(head) > 0;
        }
        if (registry_.types().is_null(child)) {
            return false;
        }
        return meta_object(child, registry_).has_getter(rest);
    }
    if (!metadata_) {
        return false;
    }
    try {
        std::string last;
        auto meta = metadata_for_path(registry_, *type_, path, last);
        return meta == nullptr || meta->has_getter(last);
    } catch (const property_not_found_error&) {
        return false;
    }
}

bool meta_object::has_setter(const std::string& path) const {
    if (is_map_) {
        auto [head, rest] = split_path(path);
        if (rest.empty()) {
            return true;
        }
        std::any child = get_property(head);
        if (registry_.types().is_null(child)) {
            return true;
        }
        return meta_object(child, registry_).has_setter(rest);
    }
    if (!metadata_) {
        return false;
    }
    try {
        std::string last;
        auto meta = metadata_for_path(registry_, *type_, path, last);
        return meta == nullptr || meta->has_setter(last);
    } catch (const property_not_found_error&) {
        return false;
    }
}

std::optional<std::string> meta_object::find_property(const std::string& name) const {
    if (is_map_) {
        return name;
    }
    if (!metadata_) {
        return std::nullopt;
    }
    auto meta = metadata_;
    std::string built;
    std::string remaining = name;
    while (true) {
        auto [head, rest] = split_path(remaining);
        auto property = meta->find_property_name(head);
        if (!property) {
            return std::nullopt;
        }
        built += *property;
        if (rest.empty()) {
            return built;
        }
        if (!meta->has_getter(*property)) {
            return std::nullopt;
        }
        const meta_type& next = unwrap(meta->getter_type(*property));
        if (is_dynamic(registry_.types(), next)) {
            return built + "." + rest;
        }
        if (next.is_scalar()) {
            return std::nullopt;
        }
        meta = registry_.find_for_type(next);
        built += ".";
        remaining = rest;
    }
}

std::vector<std::string> meta_object::getter_names() const {
    if (is_map_) {
        std::vector<std::string> names;
        for (const auto& [key, _] : *static_cast<const param_map*>(target_)) {
            names.push_back(key);
        }
        std::sort(names.begin(), names.end());
        return names;
    }
    return metadata_ ? metadata_->getable_property_names() : std::vector<std::string>{};
}

std::vector<std::string> meta_object::setter_names() const {
    if (is_map_) {
        return getter_names();
    }
    return metadata_ ? metadata_->setable_property_names() : std::vector<std::string>{};
}

const meta_type& meta_object::getter_type(const std::string& path) const {
    const type_registry& types = registry_.types();
    if (is_map_) {
        auto [head, rest] = split_path(path);
        std::any child = get_property(head);
        if (rest.empty() || types.is_null(child)) {
            const meta_type* type = types.type_of(child);
            return rest.empty() && type ? *type : types.object_type();
        }
        return meta_object(child, registry_).getter_type(rest);
    }
    if (!metadata_) {
        throw property_not_found_error("There is no getter for property named '" + path + "' in '" +
                                       (type_ ? type_->name() : std::string("null")) + "'");
    }
    std::string last;
    auto meta = metadata_for_path(registry_, *type_, path, last);
    return meta ? meta->getter_type(last) : types.object_type();
}

const meta_type& meta_object::setter_type(const std::string& path) const {
    const type_registry& types = registry_.types();
    if (is_map_) {
        return getter_type(path);
    }
    if (!metadata_) {
        throw property_not_found_error("There is no setter for property named '" + path + "' in '" +
                                       (type_ ? type_->name() : std::string("null")) + "'");
    }
    std::string last;
    auto meta = metadata_for_path(registry_, *type_, path, last);
    return meta ? meta->setter_type(last) : types.object_type();
}

// ============================================================================
// Statement parameters
// ============================================================================

std::any resolve_parameter_value(const bound_sql& sql, const std::string& property,
                                 std::any& parameter, metadata_registry& registry) {
    const type_registry& types = registry.types();
    if (sql.has_additional_parameter(property)) {
        auto [head, rest] = split_path(property);
        std::any value = sql.additional_parameter(head);
        if (rest.empty() || types.is_null(value)) {
            return value;
        }
        return meta_object(value, registry).get_value(rest);
    }
    if (types.is_null(parameter)) {
        return {};
    }
    if (types.is_scalar(parameter)) {
        return parameter;
    }
    return meta_object(parameter, registry).get_value(property);
}

} // namespace quarry
