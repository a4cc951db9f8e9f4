#include "vm/objects/object.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"
#include "vm/context.hpp"
#include "vm/objects/class.hpp"
#include "vm/objects/instance.hpp"

namespace mica::vm {

std::string_view to_string(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Class:
        return "Class";
    case ObjectKind::Instance:
        return "Instance";
    }
    MICA_UNREACHABLE("Invalid object kind.");
}

Object::Object(Context& ctx, ObjectKind kind, Class* cls)
    : ctx_(&ctx)
    , kind_(kind)
    , class_(cls) {}

Object::~Object() {}

Class& Object::as_class() {
    MICA_CHECK(is_class(), "Expected a class, but the object is of kind {}.", kind_);
    return static_cast<Class&>(*this);
}

Instance& Object::as_instance() {
    MICA_CHECK(is_instance(), "Expected an instance, but the object is of kind {}.", kind_);
    return static_cast<Instance&>(*this);
}

Class* Object::try_as_class() {
    return is_class() ? static_cast<Class*>(this) : nullptr;
}

Instance* Object::try_as_instance() {
    return is_instance() ? static_cast<Instance*>(this) : nullptr;
}

std::optional<Value> Object::raw_read(std::string_view name) const {
    switch (kind_) {
    case ObjectKind::Class:
        return static_cast<const Class*>(this)->find_field(name);
    case ObjectKind::Instance:
        return static_cast<const Instance*>(this)->get(name);
    }
    MICA_UNREACHABLE("Invalid object kind.");
}

void Object::raw_write(Context& ctx, std::string_view name, Value value) {
    MICA_CHECK(
        owned_by(ctx), "Cannot write attribute '{}' of an object from another context.", name);
    switch (kind_) {
    case ObjectKind::Class:
        static_cast<Class*>(this)->set_field(name, std::move(value));
        return;
    case ObjectKind::Instance:
        static_cast<Instance*>(this)->set(ctx.layouts(), name, std::move(value));
        return;
    }
    MICA_UNREACHABLE("Invalid object kind.");
}

} // namespace mica::vm
