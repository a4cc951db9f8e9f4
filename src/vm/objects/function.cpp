#include "vm/objects/function.hpp"

#include "common/error.hpp"

#include <absl/container/inlined_vector.h>

namespace mica::vm {

std::shared_ptr<const Function> Function::make(std::string name, u32 params, NativeFunctionPtr body) {
    return std::make_shared<const Function>(std::move(name), params, std::move(body));
}

std::shared_ptr<const Function> Function::make_variadic(std::string name, NativeFunctionPtr body) {
    return std::make_shared<const Function>(std::move(name), std::nullopt, std::move(body));
}

Function::Function(std::string name, std::optional<u32> params, NativeFunctionPtr body)
    : name_(std::move(name))
    , params_(params)
    , body_(std::move(body)) {
    MICA_CHECK(body_, "Function '{}' must have a body.", name_);
}

Value Function::invoke(Context& ctx, absl::Span<const Value> args) const {
    if (params_ && *params_ != args.size()) {
        MICA_ERROR_WITH_CODE(errc::bad_arg, "function '{}' expects {} arguments but got {}", name_,
            *params_, args.size());
    }
    return body_(ctx, args);
}

std::shared_ptr<const BoundMethod>
BoundMethod::make(std::shared_ptr<const Function> function, Value receiver) {
    return std::make_shared<const BoundMethod>(std::move(function), std::move(receiver));
}

BoundMethod::BoundMethod(std::shared_ptr<const Function> function, Value receiver)
    : function_(std::move(function))
    , receiver_(std::move(receiver)) {
    MICA_CHECK(function_, "Bound methods require a function.");
}

Value BoundMethod::invoke(Context& ctx, absl::Span<const Value> args) const {
    absl::InlinedVector<Value, 4> full_args;
    full_args.reserve(args.size() + 1);
    full_args.push_back(receiver_);
    full_args.insert(full_args.end(), args.begin(), args.end());
    return function_->invoke(ctx, full_args);
}

std::shared_ptr<const Descriptor> Descriptor::make(std::string name, BindHookPtr bind) {
    return std::make_shared<const Descriptor>(std::move(name), std::move(bind));
}

std::shared_ptr<const Descriptor>
Descriptor::property(std::string name, std::function<Value(Context& ctx, Object& receiver)> getter) {
    MICA_CHECK(getter, "Property '{}' must have a getter.", name);
    return make(std::move(name),
        [getter = std::move(getter)](Context& ctx, const Value&, Object& receiver, Class&) {
            return getter(ctx, receiver);
        });
}

Descriptor::Descriptor(std::string name, BindHookPtr bind)
    : name_(std::move(name))
    , bind_(std::move(bind)) {
    MICA_CHECK(bind_, "Descriptor '{}' must have a bind hook.", name_);
}

Value Descriptor::bind(Context& ctx, const Value& self, Object& receiver, Class& owner) const {
    return bind_(ctx, self, receiver, owner);
}

Value call(Context& ctx, const Value& callable, absl::Span<const Value> args) {
    switch (callable.type()) {
    case ValueType::Function:
        return callable.as_function()->invoke(ctx, args);
    case ValueType::BoundMethod:
        return callable.as_bound_method()->invoke(ctx, args);
    default:
        MICA_ERROR_WITH_CODE(errc::bad_type, "value of type {} is not callable", callable.type());
    }
}

} // namespace mica::vm
