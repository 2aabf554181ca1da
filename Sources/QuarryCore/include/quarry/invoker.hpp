#pragma once

#ifdef __cplusplus

#include "type_registry.hpp"
#include <any>
#include <vector>

namespace quarry {

/// Accessor for one property of one type, chosen when the type's metadata is built.
/// `target` is the address of the object the metadata was built for; inherited
/// members adjust it to their declaring subobject.
class invoker {
public:
    virtual ~invoker() = default;

    virtual std::any invoke(void* target, std::vector<std::any>& args) const = 0;

    /// Declared property type: the setter parameter or the getter return type.
    virtual const meta_type& type() const = 0;
};

class method_invoker final : public invoker {
public:
    method_invoker(const method_desc& method, address_adjust adjust);

    std::any invoke(void* target, std::vector<std::any>& args) const override;
    const meta_type& type() const override { return *type_; }

    const method_desc& method() const { return method_; }

private:
    const method_desc& method_;
    address_adjust adjust_;
    const meta_type* type_;
};

class get_field_invoker final : public invoker {
public:
    get_field_invoker(const field_desc& field, address_adjust adjust);

    std::any invoke(void* target, std::vector<std::any>& args) const override;
    const meta_type& type() const override { return *field_.type; }

private:
    const field_desc& field_;
    address_adjust adjust_;
};

class set_field_invoker final : public invoker {
public:
    set_field_invoker(const field_desc& field, address_adjust adjust);

    std::any invoke(void* target, std::vector<std::any>& args) const override;
    const meta_type& type() const override { return *field_.type; }

private:
    const field_desc& field_;
    address_adjust adjust_;
};

} // namespace quarry

#endif // __cplusplus
