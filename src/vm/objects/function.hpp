#ifndef MICA_VM_OBJECTS_FUNCTION_HPP
#define MICA_VM_OBJECTS_FUNCTION_HPP

#include "common/defs.hpp"
#include "vm/fwd.hpp"
#include "vm/objects/value.hpp"

#include <absl/types/span.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mica::vm {

/// Signature of native function bodies. `args` contains all arguments, including
/// the receiver when the function is invoked through a bound method.
using NativeFunctionPtr = std::function<Value(Context& ctx, absl::Span<const Value> args)>;

/// An invocable value. Functions stored in a class's field table act as methods: reading them
/// through an object produces a BoundMethod that supplies the object as the first argument.
class Function final {
public:
    /// Creates a function that must be called with exactly `params` arguments.
    static std::shared_ptr<const Function> make(std::string name, u32 params, NativeFunctionPtr body);

    /// Creates a function that accepts any number of arguments.
    static std::shared_ptr<const Function> make_variadic(std::string name, NativeFunctionPtr body);

    Function(std::string name, std::optional<u32> params, NativeFunctionPtr body);

    const std::string& name() const { return name_; }

    /// The number of parameters, or an empty optional if the function is variadic.
    std::optional<u32> params() const { return params_; }

    /// Invokes the function. Throws an error with code `bad_arg` if the argument count does not
    /// match. Errors raised by the function body propagate unchanged.
    Value invoke(Context& ctx, absl::Span<const Value> args) const;

    Function(const Function&) = delete;
    Function& operator=(const Function&) = delete;

private:
    std::string name_;
    std::optional<u32> params_;
    NativeFunctionPtr body_;
};

/// A function together with the receiver it was read from.
/// Created on every attribute read that binds a method, never cached by the runtime.
///
/// NOTE: An object receiver is owned by its context's heap. The bound method must not be
/// invoked after that context was destroyed.
class BoundMethod final {
public:
    static std::shared_ptr<const BoundMethod>
    make(std::shared_ptr<const Function> function, Value receiver);

    BoundMethod(std::shared_ptr<const Function> function, Value receiver);

    const std::shared_ptr<const Function>& function() const { return function_; }
    const Value& receiver() const { return receiver_; }

    /// Invokes the underlying function with the receiver prepended to `args`.
    Value invoke(Context& ctx, absl::Span<const Value> args) const;

private:
    std::shared_ptr<const Function> function_;
    Value receiver_;
};

/// Signature of descriptor bind hooks. Receives the descriptor value itself, the object the
/// attribute was read from and that object's class. The returned value becomes the result of the read.
using BindHookPtr = std::function<Value(
    Context& ctx, const Value& descriptor, Object& receiver, Class& owner)>;

/// A class-side value with a custom bind hook.
class Descriptor final {
public:
    static std::shared_ptr<const Descriptor> make(std::string name, BindHookPtr bind);

    /// Creates a descriptor that computes the attribute's value by calling `getter` with the receiver.
    static std::shared_ptr<const Descriptor>
    property(std::string name, std::function<Value(Context& ctx, Object& receiver)> getter);

    Descriptor(std::string name, BindHookPtr bind);

    const std::string& name() const { return name_; }

    /// Calls the bind hook. Errors raised by the hook propagate unchanged.
    Value bind(Context& ctx, const Value& self, Object& receiver, Class& owner) const;

private:
    std::string name_;
    BindHookPtr bind_;
};

/// Invokes `callable` (a function or a bound method) with the given arguments.
/// Throws an error with code `bad_type` if the value cannot be invoked.
Value call(Context& ctx, const Value& callable, absl::Span<const Value> args);

} // namespace mica::vm

#endif // MICA_VM_OBJECTS_FUNCTION_HPP
