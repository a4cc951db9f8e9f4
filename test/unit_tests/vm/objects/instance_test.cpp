#include <catch2/catch.hpp>

#include "common/error.hpp"
#include "vm/context.hpp"
#include "vm/objects/all.hpp"

using namespace mica;
using namespace mica::vm;

TEST_CASE("New instances should start with the empty layout", "[instance]") {
    Context ctx;
    Class& cls = Class::make(ctx, "Point");
    Instance& instance = Instance::make(ctx, cls);

    REQUIRE(instance.is_instance());
    REQUIRE(instance.class_of() == &cls);
    REQUIRE(&instance.layout() == &ctx.layouts().empty());
    REQUIRE(instance.storage().empty());
}

TEST_CASE("Instances can only be created from classes", "[instance]") {
    Context ctx;
    Class& cls = Class::make(ctx, "Point");
    Instance& instance = Instance::make(ctx, cls);

    REQUIRE_THROWS_AS(Instance::make(ctx, instance), InternalError);
}

TEST_CASE("Raw reads should distinguish missing attributes from stored null values", "[instance]") {
    Context ctx;
    Instance& instance = Instance::make(ctx, Class::make(ctx, "Point"));

    REQUIRE_FALSE(instance.raw_read("x").has_value());

    instance.raw_write(ctx, "x", Value::null());
    auto stored = instance.raw_read("x");
    REQUIRE(stored.has_value());
    REQUIRE(stored->is_null());
}

TEST_CASE("Raw writes should extend the layout or overwrite existing slots", "[instance]") {
    Context ctx;
    Instance& instance = Instance::make(ctx, Class::make(ctx, "Point"));

    instance.raw_write(ctx, "x", Value::from_int(1));
    instance.raw_write(ctx, "y", Value::from_int(2));
    const Layout* layout = &instance.layout();
    REQUIRE(layout->size() == 2);

    instance.raw_write(ctx, "x", Value::from_int(10));
    REQUIRE(&instance.layout() == layout);
    REQUIRE(instance.storage().size() == 2);
    REQUIRE(instance.raw_read("x")->as_integer() == 10);
    REQUIRE(instance.raw_read("y")->as_integer() == 2);
}

TEST_CASE("Instances writing the same names in the same order should share a layout", "[instance]") {
    Context ctx;
    Class& point = Class::make(ctx, "Point");

    Instance& p1 = Instance::make(ctx, point);
    p1.raw_write(ctx, "x", Value::from_int(1));
    p1.raw_write(ctx, "y", Value::from_int(2));

    Instance& p2 = Instance::make(ctx, point);
    p2.raw_write(ctx, "x", Value::from_int(3));
    p2.raw_write(ctx, "y", Value::from_int(4));

    Instance& p3 = Instance::make(ctx, point);
    p3.raw_write(ctx, "y", Value::from_int(5));
    p3.raw_write(ctx, "x", Value::from_int(6));

    REQUIRE(&p1.layout() == &p2.layout());
    REQUIRE(&p1.layout() != &p3.layout());

    // Shared layouts, independent storage.
    REQUIRE(p1.storage()[0].as_integer() == 1);
    REQUIRE(p2.storage()[0].as_integer() == 3);
    REQUIRE(p3.storage()[0].as_integer() == 5);
}

TEST_CASE("Instances of different classes may share a layout", "[instance]") {
    Context ctx;
    Instance& a = Instance::make(ctx, Class::make(ctx, "A"));
    Instance& b = Instance::make(ctx, Class::make(ctx, "B"));
    a.raw_write(ctx, "value", Value::from_int(1));
    b.raw_write(ctx, "value", Value::from_string("one"));
    REQUIRE(&a.layout() == &b.layout());
}
