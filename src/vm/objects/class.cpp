#include "vm/objects/class.hpp"

#include "common/error.hpp"
#include "vm/class_hierarchy.hpp"
#include "vm/context.hpp"

namespace mica::vm {

Class& Class::make(
    Context& ctx, std::string name, Class* base, FieldTable fields, Class* metaclass) {
    TypeSystem& types = ctx.types();
    if (!base)
        base = &types.object_class();
    if (!metaclass)
        metaclass = &types.type_class();

    MICA_CHECK(base->owned_by(ctx), "The base class '{}' of class '{}' belongs to another context.",
        base->name(), name);
    MICA_CHECK(metaclass->owned_by(ctx),
        "The metaclass '{}' of class '{}' belongs to another context.", metaclass->name(), name);
    MICA_CHECK(is_subclass(*metaclass, types.type_class()),
        "The metaclass '{}' of class '{}' must be a subclass of '{}'.", metaclass->name(), name,
        types.type_class().name());

    return ctx.heap().create<Class>(ctx, std::move(name), base, std::move(fields), metaclass);
}

Class::Class(Context& ctx, std::string name, Class* base, FieldTable fields, Class* metaclass)
    : Object(ctx, ObjectKind::Class, metaclass)
    , name_(std::move(name))
    , base_(base)
    , fields_(std::move(fields)) {}

std::optional<Value> Class::find_field(std::string_view name) const {
    if (auto pos = fields_.find(absl::string_view(name.data(), name.size())); pos != fields_.end())
        return pos->second;
    return {};
}

void Class::set_field(std::string_view name, Value value) {
    fields_.insert_or_assign(std::string(name), std::move(value));
}

} // namespace mica::vm
