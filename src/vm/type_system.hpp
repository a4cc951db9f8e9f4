#ifndef MICA_VM_TYPE_SYSTEM_HPP
#define MICA_VM_TYPE_SYSTEM_HPP

#include "vm/fwd.hpp"
#include "vm/objects/class.hpp"
#include "vm/objects/value.hpp"

#include <absl/types/span.h>

#include <string_view>

namespace mica::vm {

/// Name of the class-side hook that is consulted when an attribute read cannot be resolved.
/// Invoked as `hook(object, name)`.
inline constexpr std::string_view miss_hook_name = "__missing__";

/// Name of the class-side hook that performs every attribute write.
/// Invoked as `hook(object, name, value)`. The universal base class defines a default
/// implementation that stores the value in the object itself.
inline constexpr std::string_view write_hook_name = "__write__";

/// Owns the bootstrap kernel (the universal base class and the default metaclass)
/// and implements the attribute protocol on top of the object model.
class TypeSystem final {
public:
    TypeSystem();
    ~TypeSystem();

    /// Called by the context during construction. Creates the two root classes.
    void init(Context& ctx);

    /// The universal base class. Every ancestor sequence ends here.
    Class& object_class();

    /// The default metaclass. It is its own class and the class of the universal base class.
    Class& type_class();

    /// Reads the attribute `name` of `object`:
    ///
    /// 1. A value stored directly in the object is returned as-is.
    /// 2. Otherwise, the value found by a class lookup is bound to `object`:
    ///    functions become bound methods, descriptors return the result of their bind hook
    ///    and all other values are returned unchanged.
    /// 3. Otherwise, the class-side miss hook (if any) is called with `(object, name)`.
    /// 4. Otherwise, AttributeNotFound is thrown.
    ///
    /// Errors raised by hooks propagate unchanged. `object` must belong to `ctx`.
    Value load_member(Context& ctx, Object& object, std::string_view name);

    /// Writes the attribute `name` of `object` by calling the class-side write hook with
    /// `(object, name, value)`. Errors raised by the hook propagate unchanged.
    /// `object` must belong to `ctx`.
    void store_member(Context& ctx, Object& object, std::string_view name, Value value);

    /// Reads the attribute `name` of `object` and calls the result with `args`.
    /// Equivalent to `call(ctx, load_member(ctx, object, name), args)`.
    Value
    call_method(Context& ctx, Object& object, std::string_view name, absl::Span<const Value> args);

    TypeSystem(const TypeSystem&) = delete;
    TypeSystem& operator=(const TypeSystem&) = delete;

private:
    Value bind(Context& ctx, const Value& value, Object& object, Class& cls);

private:
    Class* object_class_ = nullptr;
    Class* type_class_ = nullptr;
};

} // namespace mica::vm

#endif // MICA_VM_TYPE_SYSTEM_HPP
