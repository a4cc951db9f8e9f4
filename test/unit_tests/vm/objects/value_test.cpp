#include <catch2/catch.hpp>

#include "common/error.hpp"
#include "vm/context.hpp"
#include "vm/objects/all.hpp"

#include <limits>

using namespace mica;
using namespace mica::vm;

TEST_CASE("Default constructed values should be null", "[value]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.type() == ValueType::Null);
    REQUIRE(v.same(Value::null()));
}

TEST_CASE("Values should report their type and capability", "[value]") {
    Context ctx;
    auto func = Function::make("f", 0, [](Context&, absl::Span<const Value>) { return Value(); });
    auto desc = Descriptor::property("p", [](Context&, Object&) { return Value(); });

    struct Test {
        Value value;
        ValueType type;
        ValueCapability capability;
    };

    Test tests[] = {
        {Value::null(), ValueType::Null, ValueCapability::Data},
        {Value::from_bool(true), ValueType::Boolean, ValueCapability::Data},
        {Value::from_int(1), ValueType::Integer, ValueCapability::Data},
        {Value::from_float(1.5), ValueType::Float, ValueCapability::Data},
        {Value::from_string("abc"), ValueType::String, ValueCapability::Data},
        {Value::from_object(ctx.types().object_class()), ValueType::Object, ValueCapability::Data},
        {Value::from_function(func), ValueType::Function, ValueCapability::Invocable},
        {Value::from_bound_method(BoundMethod::make(func, Value::null())), ValueType::BoundMethod,
            ValueCapability::Invocable},
        {Value::from_descriptor(desc), ValueType::Descriptor, ValueCapability::Descriptor},
    };

    for (const auto& test : tests) {
        CAPTURE(to_string(test.type));
        REQUIRE(test.value.type() == test.type);
        REQUIRE(test.value.capability() == test.capability);
    }
}

TEST_CASE("Primitive values should compare by value", "[value]") {
    REQUIRE(Value::from_int(5).same(Value::from_int(5)));
    REQUIRE_FALSE(Value::from_int(5).same(Value::from_int(6)));
    REQUIRE_FALSE(Value::from_int(1).same(Value::from_float(1.0)));
    REQUIRE(Value::from_string("foo").same(Value::from_string("foo")));
    REQUIRE_FALSE(Value::from_bool(false).same(Value::null()));
}

TEST_CASE("Float values should compare by bit pattern", "[value]") {
    const f64 nan = std::numeric_limits<f64>::quiet_NaN();
    REQUIRE(Value::from_float(nan).same(Value::from_float(nan)));
    REQUIRE(Value::from_float(1.5).same(Value::from_float(1.5)));
    REQUIRE_FALSE(Value::from_float(0.0).same(Value::from_float(-0.0)));
    REQUIRE_FALSE(Value::from_float(nan).same(Value::from_float(1.5)));
}

TEST_CASE("Reference values should compare by identity", "[value]") {
    Context ctx;
    Class& a = Class::make(ctx, "A");
    Class& b = Class::make(ctx, "A");
    REQUIRE(Value::from_object(a).same(Value::from_object(a)));
    REQUIRE_FALSE(Value::from_object(a).same(Value::from_object(b)));

    auto body = [](Context&, absl::Span<const Value>) { return Value(); };
    auto f1 = Function::make("f", 0, body);
    auto f2 = Function::make("f", 0, body);
    REQUIRE(Value::from_function(f1).same(Value::from_function(f1)));
    REQUIRE_FALSE(Value::from_function(f1).same(Value::from_function(f2)));
}

TEST_CASE("Checked accessors should reject values of the wrong type", "[value]") {
    Value v = Value::from_int(3);
    REQUIRE(v.as_integer() == 3);

    try {
        v.as_string();
        FAIL("Expected an error.");
    } catch (const Error& e) {
        REQUIRE(e.code() == errc::bad_type);
    }

    REQUIRE_THROWS_AS(Value::null().as_object(), Error);
    REQUIRE_THROWS_AS(Value::from_string("x").as_function(), Error);
}

TEST_CASE("Values should have a readable string representation", "[value]") {
    Context ctx;
    Class& point = Class::make(ctx, "Point");
    Instance& p = Instance::make(ctx, point);

    REQUIRE(to_string(Value::null()) == "null");
    REQUIRE(to_string(Value::from_bool(true)) == "true");
    REQUIRE(to_string(Value::from_int(-12)) == "-12");
    REQUIRE(to_string(Value::from_string("hi")) == "\"hi\"");
    REQUIRE(to_string(Value::from_object(point)) == "<class Point>");
    REQUIRE(to_string(Value::from_object(p)) == "<Point instance>");
    REQUIRE(fmt::format("{}", ValueType::BoundMethod) == "BoundMethod");
    REQUIRE(fmt::format("{}", Value::from_int(7)) == "7");
}
