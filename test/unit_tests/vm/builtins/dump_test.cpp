#include <catch2/catch.hpp>

#include "vm/builtins/dump.hpp"
#include "vm/context.hpp"
#include "vm/objects/all.hpp"

using namespace mica;
using namespace mica::vm;

TEST_CASE("Dump should format primitive values", "[dump]") {
    REQUIRE(dump(Value::null()) == "null");
    REQUIRE(dump(Value::from_bool(false)) == "false");
    REQUIRE(dump(Value::from_int(-3)) == "-3");
    REQUIRE(dump(Value::from_string("abc")) == "\"abc\"");
}

TEST_CASE("Dump should list instance attributes in slot order", "[dump]") {
    Context ctx;
    Instance& p = Instance::make(ctx, Class::make(ctx, "Point"));
    ctx.types().store_member(ctx, p, "y", Value::from_int(2));
    ctx.types().store_member(ctx, p, "x", Value::from_int(1));

    REQUIRE(dump(Value::from_object(p)) == "Point{y: 2, x: 1}");

    Instance& empty = Instance::make(ctx, Class::make(ctx, "Empty"));
    REQUIRE(dump(Value::from_object(empty)) == "Empty{}");
}

TEST_CASE("Dump should list class fields sorted by name", "[dump]") {
    Context ctx;
    Class::FieldTable fields;
    fields.emplace("b", Value::from_int(2));
    fields.emplace("a", Value::from_string("x"));
    Class& cls = Class::make(ctx, "Thing", nullptr, std::move(fields));

    REQUIRE(dump(Value::from_object(cls)) == "class Thing(object) {a: \"x\", b: 2}");
}

TEST_CASE("Dump should cut reference cycles", "[dump]") {
    Context ctx;
    Class& node = Class::make(ctx, "Node");
    Instance& a = Instance::make(ctx, node);
    Instance& b = Instance::make(ctx, node);
    ctx.types().store_member(ctx, a, "next", Value::from_object(b));
    ctx.types().store_member(ctx, b, "next", Value::from_object(a));

    REQUIRE(dump(Value::from_object(a)) == "Node{next: Node{next: ...}}");
}

TEST_CASE("Dump should print shared objects more than once", "[dump]") {
    Context ctx;
    Class& box = Class::make(ctx, "Box");
    Instance& leaf = Instance::make(ctx, box);
    Instance& pair = Instance::make(ctx, box);
    ctx.types().store_member(ctx, pair, "l", Value::from_object(leaf));
    ctx.types().store_member(ctx, pair, "r", Value::from_object(leaf));

    REQUIRE(dump(Value::from_object(pair)) == "Box{l: Box{}, r: Box{}}");
}

TEST_CASE("Dump should support indented output", "[dump]") {
    Context ctx;
    Class& point = Class::make(ctx, "Point");
    Instance& inner = Instance::make(ctx, point);
    ctx.types().store_member(ctx, inner, "x", Value::from_int(1));
    Instance& outer = Instance::make(ctx, point);
    ctx.types().store_member(ctx, outer, "x", Value::from_object(inner));
    ctx.types().store_member(ctx, outer, "y", Value::from_int(2));

    REQUIRE(dump(Value::from_object(outer), true)
            == "Point{\n"
               "    x: Point{\n"
               "        x: 1\n"
               "    },\n"
               "    y: 2\n"
               "}");
}
