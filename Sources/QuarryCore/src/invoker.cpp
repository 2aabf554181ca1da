#include "quarry/invoker.hpp"

namespace quarry {

namespace {
    void* apply(const address_adjust& adjust, void* target) {
        return adjust ? adjust(target) : target;
    }
}

method_invoker::method_invoker(const method_desc& method, address_adjust adjust)
    : method_(method), adjust_(std::move(adjust)),
      type_(method.param_types.size() == 1 ? method.param_types.front() : method.return_type) {}

std::any method_invoker::invoke(void* target, std::vector<std::any>& args) const {
    if (target == nullptr) {
        throw reflection_error("Cannot invoke " + method_.name + " on a null object");
    }
    return method_.invoke(apply(adjust_, target), args);
}

get_field_invoker::get_field_invoker(const field_desc& field, address_adjust adjust)
    : field_(field), adjust_(std::move(adjust)) {}

std::any get_field_invoker::invoke(void* target, std::vector<std::any>&) const {
    if (field_.is_static) {
        return field_.get(nullptr);
    }
    if (target == nullptr) {
        throw reflection_error("Cannot read field " + field_.name + " of a null object");
    }
    return field_.get(apply(adjust_, target));
}

set_field_invoker::set_field_invoker(const field_desc& field, address_adjust adjust)
    : field_(field), adjust_(std::move(adjust)) {}

std::any set_field_invoker::invoke(void* target, std::vector<std::any>& args) const {
    if (args.size() != 1) {
        throw reflection_error("Field " + field_.name + " takes exactly one value");
    }
    if (!field_.set) {
        throw reflection_error("Cannot assign to final field " + field_.name + " of " +
                               field_.declaring_type->name());
    }
    if (field_.is_static) {
        field_.set(nullptr, args.front());
        return {};
    }
    if (target == nullptr) {
        throw reflection_error("Cannot write field " + field_.name + " of a null object");
    }
    field_.set(apply(adjust_, target), args.front());
    return {};
}

} // namespace quarry
