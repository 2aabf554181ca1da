#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "types.hpp"
#include <algorithm>
#include <any>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quarry {

class type_registry;
class meta_type;
template<typename T> class type_builder;

enum class member_access {
    public_access,
    private_access
};

/// Maps the address of a derived object to the address of one of its base subobjects.
using address_adjust = std::function<void*(void*)>;

/// Converts a value of the derived type into a value of the supertype.
using upcast_fn = std::function<std::any(const std::any&)>;

struct supertype_link {
    const meta_type* type = nullptr;
    address_adjust adjust;  // null for links between handle types (shared_ptr<T> -> shared_ptr<B>)
    upcast_fn upcast;       // null when the supertype cannot hold a copy (abstract, non-copyable)
};

struct method_desc {
    std::string name;
    const meta_type* declaring_type = nullptr;
    const meta_type* return_type = nullptr;
    std::vector<const meta_type*> param_types;
    member_access access = member_access::public_access;
    std::function<std::any(void* target, std::vector<std::any>& args)> invoke;

    /// returnType#name:param1,param2. Identifies a method across a hierarchy.
    std::string signature() const;
};

struct field_desc {
    std::string name;
    const meta_type* declaring_type = nullptr;
    const meta_type* type = nullptr;
    bool is_static = false;
    bool is_final = false;
    member_access access = member_access::public_access;
    std::function<std::any(const void* target)> get;
    std::function<void(void* target, const std::any& value)> set;  // empty for const members
};

struct constructor_desc {
    std::vector<const meta_type*> param_types;
    member_access access = member_access::public_access;
    std::function<std::any()> create;  // yields std::shared_ptr<T> inside the any
};

// ============================================================================
// meta_type - runtime description of one C++ type
// ============================================================================

class meta_type {
public:
    meta_type(std::string name, std::type_index id) : name_(std::move(name)), id_(id) {}

    meta_type(const meta_type&) = delete;
    meta_type& operator=(const meta_type&) = delete;

    const std::string& name() const { return name_; }
    std::type_index id() const { return id_; }

    const std::vector<supertype_link>& supertypes() const { return supertypes_; }
    const std::vector<method_desc>& methods() const { return methods_; }
    const std::vector<field_desc>& fields() const { return fields_; }
    const std::vector<constructor_desc>& constructors() const { return constructors_; }

    /// For std::shared_ptr<T>: the descriptor of T.
    const meta_type* pointee() const { return pointee_; }
    /// For collections: the descriptor of the element type.
    const meta_type* element_type() const { return element_; }

    bool is_object() const { return is_object_; }
    bool is_scalar() const { return static_cast<bool>(to_column_); }
    bool is_collection() const { return static_cast<bool>(collector_); }

    /// True if a value of `other` can be used where this type is expected
    /// (same type, the object root, or a registered subtype).
    bool is_assignable_from(const meta_type& other) const;

    /// True if `ancestor` is reachable through the supertype links of this type.
    bool derives_from(const meta_type& ancestor) const;

    /// Address of the described object inside `holder`, or nullptr when the
    /// holder is empty or holds a null handle.
    void* address_of(std::any& holder) const;
    const void* address_of(const std::any& holder) const;

    column_value_t to_column_value(const std::any& value) const;
    std::any from_column_value(const column_value_t& value) const;

    /// Builds a value of this collection type from a row list.
    std::any make_collection(const result_list& rows, const type_registry& types) const;

private:
    friend class type_registry;
    template<typename T> friend class type_builder;

    std::string name_;
    std::type_index id_;
    std::vector<supertype_link> supertypes_;
    std::vector<method_desc> methods_;
    std::vector<field_desc> fields_;
    std::vector<constructor_desc> constructors_;
    const meta_type* pointee_ = nullptr;
    const meta_type* element_ = nullptr;
    bool is_object_ = false;
    void* (*address_)(std::any&) = nullptr;
    const void* (*const_address_)(const std::any&) = nullptr;
    std::function<column_value_t(const std::any&)> to_column_;
    std::function<std::any(const column_value_t&)> from_column_;
    std::function<std::any(const result_list&, const type_registry&)> collector_;
};

namespace detail {
    std::string demangle(const char* mangled);

    template<typename T>
    std::string type_name() {
        return demangle(typeid(T).name());
    }

    template<typename... Ts> struct type_list {};

    /// Unwraps an any into T. Null becomes T{} where T is default-constructible.
    template<typename T>
    T any_to(const std::any& value) {
        if constexpr (std::is_same_v<T, std::any>) {
            return value;
        } else {
            if (!value.has_value()) {
                if constexpr (std::is_default_constructible_v<T>) {
                    return T{};
                } else {
                    throw reflection_error("Cannot assign null to a value of type " + type_name<T>());
                }
            }
            if (const T* typed = std::any_cast<T>(&value)) {
                return *typed;
            }
            throw reflection_error("Cannot assign a value of type " + demangle(value.type().name()) +
                                   " to a value of type " + type_name<T>());
        }
    }

    template<typename R, typename Self, typename Fn, typename... Args, std::size_t... I>
    std::any call_member(type_list<Args...>, Self* self, Fn fn, std::vector<std::any>& args,
                         std::index_sequence<I...>) {
        if (args.size() != sizeof...(Args)) {
            throw reflection_error("Wrong number of arguments: expected " + std::to_string(sizeof...(Args)) +
                                   ", got " + std::to_string(args.size()));
        }
        if constexpr (std::is_void_v<R>) {
            (self->*fn)(any_to<std::decay_t<Args>>(args[I])...);
            return {};
        } else {
            return std::any(static_cast<std::decay_t<R>>((self->*fn)(any_to<std::decay_t<Args>>(args[I])...)));
        }
    }
} // namespace detail

// ============================================================================
// type_registry - the set of described types (the "class table")
// ============================================================================

class type_registry {
public:
    /// Registers the built-in scalars, the object root, result_list and param_map.
    type_registry();

    type_registry(const type_registry&) = delete;
    type_registry& operator=(const type_registry&) = delete;

    /// Descriptor for T, created on first use.
    template<typename T>
    const meta_type& ensure();

    /// Starts (or continues) describing T under a readable name.
    template<typename T>
    type_builder<T> describe(const std::string& name);

    const meta_type* find(std::type_index id) const;

    template<typename T>
    const meta_type* find() const { return find(std::type_index(typeid(T))); }

    const meta_type& object_type() const { return *object_type_; }
    const meta_type& void_type() const { return *void_type_; }
    const meta_type& list_type() const { return *list_type_; }
    const meta_type& map_type() const { return *map_type_; }

    /// Descriptor of the value held by `value`, or nullptr when unregistered or empty.
    const meta_type* type_of(const std::any& value) const;

    /// Descriptor of the object `value` refers to (shared_ptr handles are unwrapped).
    const meta_type* find_object_type(const std::any& value) const;

    /// True for empty anys and null shared_ptr handles.
    bool is_null(const std::any& value) const;

    /// True if `value` holds a registered scalar.
    bool is_scalar(const std::any& value) const;

    /// Converts `value` so that it can be assigned to `target`: upcasts along
    /// supertype links and widens between scalars. Throws reflection_error.
    std::any convert(const std::any& value, const meta_type& target) const;

    /// Scalar `value` as a store value. Null maps to nullptr; non-scalars throw reflection_error.
    column_value_t to_column_value(const std::any& value) const;

    /// Store value as an instance of the scalar `target`. Null maps to an empty any.
    std::any from_column_value(const column_value_t& value, const meta_type& target) const;

private:
    template<typename T> friend class type_builder;

    const meta_type& insert(std::unique_ptr<meta_type> type);
    meta_type& mutable_type(const meta_type& type) { return const_cast<meta_type&>(type); }
    bool convert_along(const std::any& value, const meta_type& from, const meta_type& target, std::any& out) const;

    template<typename T>
    void register_scalar(const std::string& name);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<meta_type>> types_;
    const meta_type* object_type_ = nullptr;
    const meta_type* void_type_ = nullptr;
    const meta_type* list_type_ = nullptr;
    const meta_type* map_type_ = nullptr;
};

// ============================================================================
// type_builder - fluent declaration of a type's accessors, fields and bases
//
// Usage:
//   types.describe<Author>("Author")
//       .extends<Person>()
//       .method("getName", &Author::getName)
//       .method("setName", &Author::setName)
//       .field("id", &Author::id);
// ============================================================================

template<typename T>
class type_builder {
public:
    type_builder(type_registry& registry, meta_type& type) : registry_(registry), type_(type) {}

    template<typename B>
    type_builder& extends() {
        static_assert(std::is_base_of_v<B, T>, "extends<B>() requires B to be a base of T");
        const meta_type& base = registry_.ensure<B>();

        supertype_link link;
        link.type = &base;
        link.adjust = [](void* p) -> void* {
            return static_cast<B*>(static_cast<T*>(p));
        };
        if constexpr (std::is_copy_constructible_v<B> && !std::is_abstract_v<B>) {
            link.upcast = [](const std::any& v) -> std::any {
                return std::any(B(std::any_cast<const T&>(v)));
            };
        }
        type_.supertypes_.push_back(std::move(link));

        meta_type& handle = registry_.mutable_type(registry_.ensure<std::shared_ptr<T>>());
        supertype_link handle_link;
        handle_link.type = &registry_.ensure<std::shared_ptr<B>>();
        handle_link.upcast = [](const std::any& v) -> std::any {
            return std::any(std::shared_ptr<B>(std::any_cast<const std::shared_ptr<T>&>(v)));
        };
        handle.supertypes_.push_back(std::move(handle_link));
        return *this;
    }

    template<typename R, typename C, typename... Args>
    type_builder& method(const std::string& name, R (C::*fn)(Args...),
                         member_access access = member_access::public_access) {
        static_assert(std::is_base_of_v<C, T> || std::is_same_v<C, T>, "method must be a member of T");
        add_method<R, Args...>(name, access, [fn](void* target, std::vector<std::any>& args) {
            C* self = static_cast<T*>(target);
            return detail::call_member<R>(detail::type_list<Args...>{}, self, fn, args,
                                          std::index_sequence_for<Args...>{});
        });
        return *this;
    }

    template<typename R, typename C, typename... Args>
    type_builder& method(const std::string& name, R (C::*fn)(Args...) const,
                         member_access access = member_access::public_access) {
        static_assert(std::is_base_of_v<C, T> || std::is_same_v<C, T>, "method must be a member of T");
        add_method<R, Args...>(name, access, [fn](void* target, std::vector<std::any>& args) {
            const C* self = static_cast<const T*>(target);
            return detail::call_member<R>(detail::type_list<Args...>{}, self, fn, args,
                                          std::index_sequence_for<Args...>{});
        });
        return *this;
    }

    template<typename F, typename C>
    type_builder& field(const std::string& name, F C::*member,
                        member_access access = member_access::public_access) {
        static_assert(std::is_base_of_v<C, T> || std::is_same_v<C, T>, "field must be a member of T");
        using value_t = std::remove_cv_t<F>;
        field_desc desc;
        desc.name = name;
        desc.declaring_type = &type_;
        desc.type = &registry_.ensure<value_t>();
        desc.is_static = false;
        desc.is_final = std::is_const_v<F>;
        desc.access = access;
        desc.get = [member](const void* target) -> std::any {
            const C* self = static_cast<const T*>(target);
            return std::any(static_cast<value_t>(self->*member));
        };
        if constexpr (!std::is_const_v<F>) {
            desc.set = [member](void* target, const std::any& value) {
                C* self = static_cast<T*>(target);
                self->*member = detail::any_to<value_t>(value);
            };
        }
        type_.fields_.push_back(std::move(desc));
        return *this;
    }

    template<typename F>
    type_builder& static_field(const std::string& name, F* variable, bool is_final = false,
                               member_access access = member_access::public_access) {
        using value_t = std::remove_cv_t<F>;
        field_desc desc;
        desc.name = name;
        desc.declaring_type = &type_;
        desc.type = &registry_.ensure<value_t>();
        desc.is_static = true;
        desc.is_final = is_final || std::is_const_v<F>;
        desc.access = access;
        desc.get = [variable](const void*) -> std::any {
            return std::any(static_cast<value_t>(*variable));
        };
        if constexpr (!std::is_const_v<F>) {
            if (!desc.is_final) {
                desc.set = [variable](void*, const std::any& value) {
                    *variable = detail::any_to<value_t>(value);
                };
            }
        }
        type_.fields_.push_back(std::move(desc));
        return *this;
    }

    /// Declares (or re-declares with a different access) the zero-argument constructor.
    type_builder& default_constructor(member_access access = member_access::public_access) {
        no_default_constructor();
        constructor_desc desc;
        desc.access = access;
        desc.create = [] { return std::any(std::make_shared<T>()); };
        type_.constructors_.push_back(std::move(desc));
        return *this;
    }

    /// Declares a zero-argument factory for types whose constructor is not reachable from here.
    type_builder& default_constructor(std::function<std::shared_ptr<T>()> factory,
                                      member_access access = member_access::public_access) {
        no_default_constructor();
        constructor_desc desc;
        desc.access = access;
        desc.create = [factory] { return std::any(factory()); };
        type_.constructors_.push_back(std::move(desc));
        return *this;
    }

    type_builder& no_default_constructor() {
        auto& ctors = type_.constructors_;
        ctors.erase(std::remove_if(ctors.begin(), ctors.end(),
                                   [](const constructor_desc& c) { return c.param_types.empty(); }),
                    ctors.end());
        return *this;
    }

    const meta_type& type() const { return type_; }

private:
    template<typename R, typename... Args, typename Invoke>
    void add_method(const std::string& name, member_access access, Invoke&& invoke) {
        method_desc desc;
        desc.name = name;
        desc.declaring_type = &type_;
        if constexpr (std::is_void_v<R>) {
            desc.return_type = &registry_.void_type();
        } else {
            desc.return_type = &registry_.ensure<std::decay_t<R>>();
        }
        desc.param_types = {&registry_.ensure<std::decay_t<Args>>()...};
        desc.access = access;
        desc.invoke = std::forward<Invoke>(invoke);
        type_.methods_.push_back(std::move(desc));
    }

    type_registry& registry_;
    meta_type& type_;
};

// ============================================================================
// Template implementations
// ============================================================================

template<typename T>
const meta_type& type_registry::ensure() {
    static_assert(std::is_same_v<T, std::decay_t<T>>, "ensure<T>() takes an unqualified type");
    if (const meta_type* existing = find(std::type_index(typeid(T)))) {
        return *existing;
    }

    auto type = std::make_unique<meta_type>(detail::type_name<T>(), std::type_index(typeid(T)));

    if constexpr (detail::is_shared_ptr<T>::value) {
        using U = typename T::element_type;
        type->pointee_ = &ensure<std::remove_cv_t<U>>();
        type->name_ = "shared_ptr<" + type->pointee_->name() + ">";
        type->address_ = [](std::any& holder) -> void* {
            auto* handle = std::any_cast<T>(&holder);
            return handle ? const_cast<std::remove_cv_t<U>*>(handle->get()) : nullptr;
        };
        type->const_address_ = [](const std::any& holder) -> const void* {
            const auto* handle = std::any_cast<T>(&holder);
            return handle ? handle->get() : nullptr;
        };
    } else {
        if constexpr (std::is_copy_constructible_v<T>) {
            type->address_ = [](std::any& holder) -> void* {
                return std::any_cast<T>(&holder);
            };
            type->const_address_ = [](const std::any& holder) -> const void* {
                return std::any_cast<T>(&holder);
            };
        }
        if constexpr (detail::is_vector<T>::value) {
            using E = typename T::value_type;
            const meta_type* element = &ensure<E>();
            type->element_ = element;
            type->collector_ = [element](const result_list& rows, const type_registry& types) -> std::any {
                T out;
                out.reserve(rows.size());
                for (const auto& row : rows) {
                    out.push_back(detail::any_to<E>(types.convert(row, *element)));
                }
                return std::any(std::move(out));
            };
        }
        if constexpr (std::is_default_constructible_v<T> && !std::is_abstract_v<T>) {
            constructor_desc ctor;
            ctor.create = [] { return std::any(std::make_shared<T>()); };
            type->constructors_.push_back(std::move(ctor));
        }
    }

    return insert(std::move(type));
}

template<typename T>
type_builder<T> type_registry::describe(const std::string& name) {
    meta_type& type = mutable_type(ensure<T>());
    type.name_ = name;
    return type_builder<T>(*this, type);
}

} // namespace quarry

#endif // __cplusplus
