#ifndef MICA_VM_OBJECTS_VALUE_HPP
#define MICA_VM_OBJECTS_VALUE_HPP

#include "common/defs.hpp"
#include "common/format.hpp"
#include "vm/objects/fwd.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace mica::vm {

/// The type tag of a value. The order matches the alternatives of Value's storage.
enum class ValueType : u8 {
    Null,
    Boolean,
    Integer,
    Float,
    String,
    Object,
    Function,
    BoundMethod,
    Descriptor,
};

std::string_view to_string(ValueType type);

/// Describes how the attribute protocol treats a value that was found on the class side.
enum class ValueCapability : u8 {
    Data,       ///< Returned as-is.
    Invocable,  ///< Bound to the receiver when read through an object.
    Descriptor, ///< The value's bind hook computes the result.
};

std::string_view to_string(ValueCapability capability);

/// The uniform representation of all values handled by the runtime.
///
/// Primitive values (null, booleans, numbers and strings) are stored inline.
/// Objects are referenced by pointer and owned by the context's heap.
/// Functions, bound methods and descriptors are shared, immutable and reference counted.
class Value final {
public:
    static Value null() { return Value(); }
    static Value from_bool(bool value) { return Value(Storage(std::in_place_type<bool>, value)); }
    static Value from_int(i64 value) { return Value(Storage(std::in_place_type<i64>, value)); }
    static Value from_float(f64 value) { return Value(Storage(std::in_place_type<f64>, value)); }
    static Value from_string(std::string value);
    static Value from_object(Object& object);
    static Value from_function(std::shared_ptr<const Function> function);
    static Value from_bound_method(std::shared_ptr<const BoundMethod> method);
    static Value from_descriptor(std::shared_ptr<const Descriptor> descriptor);

    /// Same as Value::null().
    Value() = default;

    ValueType type() const { return static_cast<ValueType>(storage_.index()); }

    /// Returns the capability implied by this value's type.
    ValueCapability capability() const;

    bool is_null() const { return type() == ValueType::Null; }
    bool is_bool() const { return type() == ValueType::Boolean; }
    bool is_integer() const { return type() == ValueType::Integer; }
    bool is_float() const { return type() == ValueType::Float; }
    bool is_string() const { return type() == ValueType::String; }
    bool is_object() const { return type() == ValueType::Object; }
    bool is_function() const { return type() == ValueType::Function; }
    bool is_bound_method() const { return type() == ValueType::BoundMethod; }
    bool is_descriptor() const { return type() == ValueType::Descriptor; }

    /// Checked accessors. Throw an error with code `bad_type` if the value has a different type.
    bool as_bool() const;
    i64 as_integer() const;
    f64 as_float() const;
    const std::string& as_string() const;
    Object& as_object() const;
    const std::shared_ptr<const Function>& as_function() const;
    const std::shared_ptr<const BoundMethod>& as_bound_method() const;
    const std::shared_ptr<const Descriptor>& as_descriptor() const;

    /// True if these are the same values. Reference types (objects, functions, bound methods
    /// and descriptors) compare by identity, floats by their bit pattern (NaN is the same as
    /// itself, 0.0 and -0.0 differ) and everything else by value.
    bool same(const Value& other) const;

private:
    using Storage = std::variant<std::monostate, bool, i64, f64, std::string, Object*,
        std::shared_ptr<const Function>, std::shared_ptr<const BoundMethod>,
        std::shared_ptr<const Descriptor>>;

    static_assert(std::variant_size_v<Storage> == static_cast<size_t>(ValueType::Descriptor) + 1);

    explicit Value(Storage storage)
        : storage_(std::move(storage)) {}

    template<ValueType Type>
    const auto& checked_get() const;

private:
    Storage storage_;
};

/// Returns a short, human readable representation of the value.
std::string to_string(const Value& value);

} // namespace mica::vm

MICA_ENABLE_FREE_TO_STRING(mica::vm::ValueType)
MICA_ENABLE_FREE_TO_STRING(mica::vm::ValueCapability)
MICA_ENABLE_FREE_TO_STRING(mica::vm::Value)

#endif // MICA_VM_OBJECTS_VALUE_HPP
