#include "vm/builtins/dump.hpp"
#include "vm/class_hierarchy.hpp"
#include "vm/context.hpp"
#include "vm/objects/all.hpp"

#include <fmt/format.h>

using namespace mica::vm;

// This example demonstrates how a front end drives the runtime: it defines a class with
// a method, creates a few instances and shows how instances with the same attributes
// end up sharing their layout.
int main() {
    // Trace layout transitions to stdout so the layout tree becomes visible.
    ContextSettings settings;
    settings.trace_layouts = true;
    Context ctx(std::move(settings));
    TypeSystem& types = ctx.types();

    // A method receives its receiver as the first argument.
    auto norm = Function::make("norm", 1, [](Context& ctx, absl::Span<const Value> args) {
        Object& self = args[0].as_object();
        mica::i64 x = ctx.types().load_member(ctx, self, "x").as_integer();
        mica::i64 y = ctx.types().load_member(ctx, self, "y").as_integer();
        return Value::from_int(x * x + y * y);
    });

    Class::FieldTable fields;
    fields.emplace("norm", Value::from_function(norm));
    Class& point = Class::make(ctx, "Point", nullptr, std::move(fields));

    Instance& p1 = Instance::make(ctx, point);
    types.store_member(ctx, p1, "x", Value::from_int(1));
    types.store_member(ctx, p1, "y", Value::from_int(2));

    Instance& p2 = Instance::make(ctx, point);
    types.store_member(ctx, p2, "x", Value::from_int(3));
    types.store_member(ctx, p2, "y", Value::from_int(4));

    Instance& p3 = Instance::make(ctx, point);
    types.store_member(ctx, p3, "x", Value::from_int(5));
    types.store_member(ctx, p3, "z", Value::from_int(6));

    fmt::print("p1 = {} with layout {}\n", dump(Value::from_object(p1)), describe(p1.layout()));
    fmt::print("p2 = {} with layout {}\n", dump(Value::from_object(p2)), describe(p2.layout()));
    fmt::print("p3 = {} with layout {}\n", dump(Value::from_object(p3)), describe(p3.layout()));
    fmt::print("p1 and p2 share a layout: {}\n", &p1.layout() == &p2.layout());
    fmt::print("p1 and p3 share a layout: {}\n", &p1.layout() == &p3.layout());
    fmt::print("p2.norm() = {}\n", types.call_method(ctx, p2, "norm", {}));
    fmt::print("p1 is a Point: {}\n", is_instance(p1, point));
    fmt::print("{} layouts, {} objects\n", ctx.layouts().layout_count(), ctx.heap().object_count());
    return 0;
}
