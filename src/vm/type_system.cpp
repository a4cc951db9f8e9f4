#include "vm/type_system.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"
#include "vm/class_hierarchy.hpp"
#include "vm/context.hpp"
#include "vm/objects/function.hpp"

#include <fmt/format.h>

namespace mica::vm {

static Class& class_of_checked(Context& ctx, Object& object) {
    MICA_CHECK(object.owned_by(ctx), "The object belongs to another context.");
    Class* cls = object.class_of();
    MICA_CHECK(cls, "Object has no class, the bootstrap kernel is not initialized.");
    return *cls;
}

static Value default_write_hook(Context& ctx, absl::Span<const Value> args) {
    MICA_DEBUG_ASSERT(args.size() == 3, "Invalid number of arguments.");
    args[0].as_object().raw_write(ctx, args[1].as_string(), args[2]);
    return Value::null();
}

TypeSystem::TypeSystem() {}

TypeSystem::~TypeSystem() {}

void TypeSystem::init(Context& ctx) {
    MICA_CHECK(!object_class_ && !type_class_, "The bootstrap kernel was already initialized.");

    // Both roots are created without a class and patched once the metaclass exists.
    Heap& heap = ctx.heap();
    Class& object = heap.create<Class>(ctx, "object", nullptr, Class::FieldTable(), nullptr);
    Class& type = heap.create<Class>(ctx, "type", &object, Class::FieldTable(), nullptr);
    type.patch_class(type);
    object.patch_class(type);

    object.set_field(write_hook_name,
        Value::from_function(Function::make(std::string(write_hook_name), 3, default_write_hook)));

    object_class_ = &object;
    type_class_ = &type;
}

Class& TypeSystem::object_class() {
    MICA_DEBUG_ASSERT(object_class_, "The bootstrap kernel is not initialized.");
    return *object_class_;
}

Class& TypeSystem::type_class() {
    MICA_DEBUG_ASSERT(type_class_, "The bootstrap kernel is not initialized.");
    return *type_class_;
}

Value TypeSystem::load_member(Context& ctx, Object& object, std::string_view name) {
    Class& cls = class_of_checked(ctx, object);

    if (auto stored = object.raw_read(name))
        return std::move(*stored);

    if (auto found = class_lookup(cls, name))
        return bind(ctx, *found, object, cls);

    // Hooks are resolved on the class side only, never through this function.
    if (auto hook = class_lookup(cls, miss_hook_name)) {
        if (ctx.settings().trace_hooks)
            ctx.print(fmt::format("miss hook: {}.{}\n", cls.name(), name));
        return call(ctx, *hook, {Value::from_object(object), Value::from_string(std::string(name))});
    }

    throw AttributeNotFound(std::string(name));
}

void TypeSystem::store_member(Context& ctx, Object& object, std::string_view name, Value value) {
    Class& cls = class_of_checked(ctx, object);

    auto hook = class_lookup(cls, write_hook_name);
    MICA_CHECK(hook, "Class '{}' does not resolve a write hook.", cls.name());

    if (ctx.settings().trace_hooks)
        ctx.print(fmt::format("write hook: {}.{} = {}\n", cls.name(), name, value));
    call(ctx, *hook,
        {Value::from_object(object), Value::from_string(std::string(name)), std::move(value)});
}

Value TypeSystem::call_method(
    Context& ctx, Object& object, std::string_view name, absl::Span<const Value> args) {
    Value method = load_member(ctx, object, name);
    return call(ctx, method, args);
}

Value TypeSystem::bind(Context& ctx, const Value& value, Object& object, Class& cls) {
    switch (value.capability()) {
    case ValueCapability::Data:
        return value;
    case ValueCapability::Invocable:
        // Bound methods already carry their receiver.
        if (value.is_function())
            return Value::from_bound_method(
                BoundMethod::make(value.as_function(), Value::from_object(object)));
        return value;
    case ValueCapability::Descriptor:
        return value.as_descriptor()->bind(ctx, value, object, cls);
    }
    MICA_UNREACHABLE("Invalid value capability.");
}

} // namespace mica::vm
