#ifndef MICA_VM_OBJECTS_OBJECT_HPP
#define MICA_VM_OBJECTS_OBJECT_HPP

#include "common/defs.hpp"
#include "vm/fwd.hpp"
#include "vm/objects/fwd.hpp"
#include "vm/objects/value.hpp"

#include <optional>
#include <string_view>

namespace mica::vm {

enum class ObjectKind : u8 {
    Class,
    Instance,
};

std::string_view to_string(ObjectKind kind);

/// Base of all objects in the object graph. Every object is either a Class (table backed storage)
/// or an Instance (layout backed storage) and refers to the class it is an instance of.
///
/// Objects are allocated by (and owned by) the context's heap.
class Object {
public:
    virtual ~Object();

    ObjectKind kind() const { return kind_; }
    bool is_class() const { return kind_ == ObjectKind::Class; }
    bool is_instance() const { return kind_ == ObjectKind::Instance; }

    /// The class of this object. Only null for the two root classes during bootstrap.
    Class* class_of() const { return class_; }

    /// The context that allocated this object.
    Context& context() const { return *ctx_; }

    /// True if this object was allocated by `ctx`.
    bool owned_by(const Context& ctx) const { return ctx_ == &ctx; }

    /// Checked downcasts. Throw an internal error if the object is of another kind.
    Class& as_class();
    Instance& as_instance();

    Class* try_as_class();
    Instance* try_as_instance();

    /// Storage level read of a directly stored attribute. Never consults the class.
    /// Returns an empty optional if the object does not store `name`.
    std::optional<Value> raw_read(std::string_view name) const;

    /// Storage level write. Instances overwrite an occupied slot or transition to
    /// an extended layout, classes write their field table.
    /// It is an internal error if the object does not belong to `ctx`.
    void raw_write(Context& ctx, std::string_view name, Value value);

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

protected:
    Object(Context& ctx, ObjectKind kind, Class* cls);

private:
    // The bootstrap kernel patches the class reference of the two root classes.
    friend TypeSystem;

    void patch_class(Class& cls) { class_ = &cls; }

private:
    Context* ctx_;
    ObjectKind kind_;
    Class* class_;
};

} // namespace mica::vm

MICA_ENABLE_FREE_TO_STRING(mica::vm::ObjectKind)

#endif // MICA_VM_OBJECTS_OBJECT_HPP
