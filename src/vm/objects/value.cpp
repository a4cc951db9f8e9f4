#include "vm/objects/value.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"
#include "vm/objects/class.hpp"
#include "vm/objects/function.hpp"

#include <cstring>

namespace mica::vm {

std::string_view to_string(ValueType type) {
    switch (type) {
#define MICA_CASE(T)     \
    case ValueType::T: \
        return #T;

        MICA_CASE(Null)
        MICA_CASE(Boolean)
        MICA_CASE(Integer)
        MICA_CASE(Float)
        MICA_CASE(String)
        MICA_CASE(Object)
        MICA_CASE(Function)
        MICA_CASE(BoundMethod)
        MICA_CASE(Descriptor)

#undef MICA_CASE
    }
    MICA_UNREACHABLE("Invalid value type.");
}

std::string_view to_string(ValueCapability capability) {
    switch (capability) {
    case ValueCapability::Data:
        return "Data";
    case ValueCapability::Invocable:
        return "Invocable";
    case ValueCapability::Descriptor:
        return "Descriptor";
    }
    MICA_UNREACHABLE("Invalid value capability.");
}

Value Value::from_string(std::string value) {
    return Value(Storage(std::in_place_type<std::string>, std::move(value)));
}

Value Value::from_object(Object& object) {
    return Value(Storage(std::in_place_type<Object*>, &object));
}

Value Value::from_function(std::shared_ptr<const Function> function) {
    MICA_CHECK(function, "Function values must not be null.");
    return Value(Storage(std::in_place_type<std::shared_ptr<const Function>>, std::move(function)));
}

Value Value::from_bound_method(std::shared_ptr<const BoundMethod> method) {
    MICA_CHECK(method, "Bound method values must not be null.");
    return Value(
        Storage(std::in_place_type<std::shared_ptr<const BoundMethod>>, std::move(method)));
}

Value Value::from_descriptor(std::shared_ptr<const Descriptor> descriptor) {
    MICA_CHECK(descriptor, "Descriptor values must not be null.");
    return Value(
        Storage(std::in_place_type<std::shared_ptr<const Descriptor>>, std::move(descriptor)));
}

ValueCapability Value::capability() const {
    switch (type()) {
    case ValueType::Function:
    case ValueType::BoundMethod:
        return ValueCapability::Invocable;
    case ValueType::Descriptor:
        return ValueCapability::Descriptor;
    default:
        return ValueCapability::Data;
    }
}

template<ValueType Type>
const auto& Value::checked_get() const {
    constexpr size_t index = static_cast<size_t>(Type);
    if (MICA_UNLIKELY(storage_.index() != index)) {
        MICA_ERROR_WITH_CODE(errc::bad_type, "expected a value of type {} but got {}",
            to_string(Type), to_string(type()));
    }
    return std::get<index>(storage_);
}

bool Value::as_bool() const {
    return checked_get<ValueType::Boolean>();
}

i64 Value::as_integer() const {
    return checked_get<ValueType::Integer>();
}

f64 Value::as_float() const {
    return checked_get<ValueType::Float>();
}

const std::string& Value::as_string() const {
    return checked_get<ValueType::String>();
}

Object& Value::as_object() const {
    Object* object = checked_get<ValueType::Object>();
    MICA_DEBUG_ASSERT(object, "Object references must not be null.");
    return *object;
}

const std::shared_ptr<const Function>& Value::as_function() const {
    return checked_get<ValueType::Function>();
}

const std::shared_ptr<const BoundMethod>& Value::as_bound_method() const {
    return checked_get<ValueType::BoundMethod>();
}

const std::shared_ptr<const Descriptor>& Value::as_descriptor() const {
    return checked_get<ValueType::Descriptor>();
}

bool Value::same(const Value& other) const {
    // Floats compare by bit pattern, so a stored NaN is the same as itself.
    if (is_float() && other.is_float()) {
        const f64 lhs = std::get<f64>(storage_);
        const f64 rhs = std::get<f64>(other.storage_);
        return std::memcmp(&lhs, &rhs, sizeof(f64)) == 0;
    }

    // Pointer alternatives (objects and shared references) compare by address.
    return storage_ == other.storage_;
}

std::string to_string(const Value& value) {
    switch (value.type()) {
    case ValueType::Null:
        return "null";
    case ValueType::Boolean:
        return value.as_bool() ? "true" : "false";
    case ValueType::Integer:
        return fmt::format("{}", value.as_integer());
    case ValueType::Float:
        return fmt::format("{}", value.as_float());
    case ValueType::String:
        return fmt::format("\"{}\"", value.as_string());
    case ValueType::Object: {
        Object& object = value.as_object();
        if (auto cls = object.try_as_class())
            return fmt::format("<class {}>", cls->name());

        Class* type = object.class_of();
        std::string_view type_name = type ? std::string_view(type->name()) : "?"sv;
        return fmt::format("<{} instance>", type_name);
    }
    case ValueType::Function:
        return fmt::format("<function {}>", value.as_function()->name());
    case ValueType::BoundMethod:
        return fmt::format("<bound method {}>", value.as_bound_method()->function()->name());
    case ValueType::Descriptor:
        return fmt::format("<descriptor {}>", value.as_descriptor()->name());
    }
    MICA_UNREACHABLE("Invalid value type.");
}

} // namespace mica::vm
