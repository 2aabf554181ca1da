#include "quarry/type_registry.hpp"
#include "quarry/log.hpp"

#include <cxxabi.h>
#include <cstdlib>
#include <mutex>
#include <sstream>

namespace quarry {

namespace detail {

std::string demangle(const char* mangled) {
    int status = 0;
    char* readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || readable == nullptr) {
        return mangled;
    }
    std::string result(readable);
    std::free(readable);
    return result;
}

std::string column_value_to_string(const column_value_t& v) {
    return std::visit([](const auto& value) -> std::string {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<V, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<V, int64_t>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<V, double>) {
            std::ostringstream out;
            out << value;
            return out.str();
        } else if constexpr (std::is_same_v<V, std::string>) {
            return value;
        } else {
            static const char* digits = "0123456789abcdef";
            std::string hex = "x'";
            for (uint8_t b : value) {
                hex += digits[b >> 4];
                hex += digits[b & 0x0F];
            }
            hex += "'";
            return hex;
        }
    }, v);
}

} // namespace detail

// ============================================================================
// method_desc
// ============================================================================

std::string method_desc::signature() const {
    std::string sig;
    if (return_type) {
        sig += return_type->id().name();
        sig += '#';
    }
    sig += name;
    for (size_t i = 0; i < param_types.size(); ++i) {
        sig += (i == 0) ? ':' : ',';
        sig += param_types[i]->id().name();
    }
    return sig;
}

// ============================================================================
// meta_type
// ============================================================================

bool meta_type::derives_from(const meta_type& ancestor) const {
    for (const auto& link : supertypes_) {
        if (link.type == &ancestor || link.type->derives_from(ancestor)) {
            return true;
        }
    }
    return false;
}

bool meta_type::is_assignable_from(const meta_type& other) const {
    if (this == &other || is_object_) {
        return true;
    }
    return other.derives_from(*this);
}

void* meta_type::address_of(std::any& holder) const {
    if (!holder.has_value() || address_ == nullptr) {
        return nullptr;
    }
    return address_(holder);
}

const void* meta_type::address_of(const std::any& holder) const {
    if (!holder.has_value() || const_address_ == nullptr) {
        return nullptr;
    }
    return const_address_(holder);
}

column_value_t meta_type::to_column_value(const std::any& value) const {
    if (!value.has_value()) {
        return nullptr;
    }
    if (!to_column_) {
        throw reflection_error("Type " + name_ + " is not a scalar type");
    }
    return to_column_(value);
}

std::any meta_type::from_column_value(const column_value_t& value) const {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return {};
    }
    if (!from_column_) {
        throw reflection_error("Type " + name_ + " is not a scalar type");
    }
    try {
        return from_column_(value);
    } catch (const std::bad_variant_access&) {
        throw reflection_error("Cannot convert store value '" + detail::column_value_to_string(value) +
                               "' to " + name_);
    }
}

std::any meta_type::make_collection(const result_list& rows, const type_registry& types) const {
    if (!collector_) {
        throw reflection_error("Type " + name_ + " is not a collection type");
    }
    return collector_(rows, types);
}

// ============================================================================
// type_registry
// ============================================================================

template<typename T>
void type_registry::register_scalar(const std::string& name) {
    auto type = std::make_unique<meta_type>(name, std::type_index(typeid(T)));
    type->address_ = [](std::any& holder) -> void* { return std::any_cast<T>(&holder); };
    type->const_address_ = [](const std::any& holder) -> const void* { return std::any_cast<T>(&holder); };
    type->to_column_ = [](const std::any& value) -> column_value_t {
        return detail::to_column_value(std::any_cast<const T&>(value));
    };
    type->from_column_ = [](const column_value_t& value) -> std::any {
        return std::any(detail::from_column_value<T>(value));
    };
    insert(std::move(type));
}

type_registry::type_registry() {
    register_scalar<bool>("bool");
    register_scalar<int>("int");
    register_scalar<int64_t>("int64");
    register_scalar<double>("double");
    register_scalar<float>("float");
    register_scalar<std::string>("string");
    register_scalar<blob_t>("blob");
    register_scalar<timestamp_t>("timestamp");
    register_scalar<uuid_t>("uuid");

    auto object = std::make_unique<meta_type>("object", std::type_index(typeid(std::any)));
    object->is_object_ = true;
    object_type_ = &insert(std::move(object));

    void_type_ = &insert(std::make_unique<meta_type>("void", std::type_index(typeid(void))));

    list_type_ = &ensure<result_list>();
    mutable_type(*list_type_).name_ = "list";

    map_type_ = &ensure<param_map>();
    mutable_type(*map_type_).name_ = "map";
    ensure<std::shared_ptr<param_map>>();
}

const meta_type& type_registry::insert(std::unique_ptr<meta_type> type) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = types_.emplace(type->id(), std::move(type));
    if (!inserted) {
        LOG_DEBUG("types", "Descriptor for %s registered concurrently, keeping the first", it->second->name().c_str());
    }
    return *it->second;
}

const meta_type* type_registry::find(std::type_index id) const {
    std::shared_lock lock(mutex_);
    auto it = types_.find(id);
    return it == types_.end() ? nullptr : it->second.get();
}

const meta_type* type_registry::type_of(const std::any& value) const {
    if (!value.has_value()) {
        return nullptr;
    }
    return find(std::type_index(value.type()));
}

const meta_type* type_registry::find_object_type(const std::any& value) const {
    const meta_type* type = type_of(value);
    if (type && type->pointee()) {
        return type->pointee();
    }
    return type;
}

bool type_registry::is_null(const std::any& value) const {
    if (!value.has_value()) {
        return true;
    }
    const meta_type* type = type_of(value);
    return type && type->pointee() && type->address_of(value) == nullptr;
}

bool type_registry::is_scalar(const std::any& value) const {
    const meta_type* type = type_of(value);
    return type && type->is_scalar();
}

bool type_registry::convert_along(const std::any& value, const meta_type& from,
                                  const meta_type& target, std::any& out) const {
    for (const auto& link : from.supertypes()) {
        if (link.type != &target && !link.type->derives_from(target)) {
            continue;
        }
        if (!link.upcast) {
            return false;
        }
        std::any lifted = link.upcast(value);
        if (link.type == &target) {
            out = std::move(lifted);
            return true;
        }
        if (convert_along(lifted, *link.type, target, out)) {
            return true;
        }
    }
    return false;
}

std::any type_registry::convert(const std::any& value, const meta_type& target) const {
    if (!value.has_value() || target.is_object()) {
        return value;
    }
    if (std::type_index(value.type()) == target.id()) {
        return value;
    }
    const meta_type* source = type_of(value);
    if (source == nullptr) {
        throw reflection_error("Cannot convert a value of unregistered type " +
                               detail::demangle(value.type().name()) + " to " + target.name());
    }
    std::any converted;
    if (source->derives_from(target) && convert_along(value, *source, target, converted)) {
        return converted;
    }
    if (source->is_scalar() && target.is_scalar()) {
        return target.from_column_value(source->to_column_value(value));
    }
    throw reflection_error("Cannot assign a value of type " + source->name() + " to type " + target.name());
}

column_value_t type_registry::to_column_value(const std::any& value) const {
    if (is_null(value)) {
        return nullptr;
    }
    const meta_type* type = type_of(value);
    if (type == nullptr) {
        throw reflection_error("Cannot bind a value of unregistered type " + detail::demangle(value.type().name()));
    }
    return type->to_column_value(value);
}

std::any type_registry::from_column_value(const column_value_t& value, const meta_type& target) const {
    if (target.is_object()) {
        return std::visit([](const auto& v) -> std::any {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::nullptr_t>) {
                return {};
            } else {
                return std::any(v);
            }
        }, value);
    }
    return target.from_column_value(value);
}

} // namespace quarry
