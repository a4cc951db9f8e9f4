#ifndef MICA_VM_OBJECTS_INSTANCE_HPP
#define MICA_VM_OBJECTS_INSTANCE_HPP

#include "vm/objects/layout.hpp"
#include "vm/objects/object.hpp"

#include <absl/container/inlined_vector.h>
#include <absl/types/span.h>

namespace mica::vm {

/// An instance of a class. Attribute values are stored positionally; the shared layout
/// maps attribute names to positions. The storage is always index aligned with the layout.
class Instance final : public Object {
public:
    /// Creates a new instance of `cls` with the empty layout and no attributes.
    /// It is an internal error if `cls` is not a class of `ctx`.
    static Instance& make(Context& ctx, Object& cls);

    /// The current layout of this instance. Layouts only ever advance to successors.
    const Layout& layout() const { return *layout_; }

    /// The attribute values, in slot order.
    absl::Span<const Value> storage() const { return storage_; }

    /// Returns the stored value of `name`, or an empty optional if the layout has no slot for it.
    std::optional<Value> get(std::string_view name) const;

    /// Stores `value` under `name`. If `name` is not yet part of the current layout, the instance
    /// transitions to the successor layout provided by `layouts` and the value is appended.
    void set(LayoutTable& layouts, std::string_view name, Value value);

private:
    friend Heap;

    Instance(Context& ctx, Class& cls, const Layout& layout);

private:
    const Layout* layout_;
    absl::InlinedVector<Value, 4> storage_;
};

} // namespace mica::vm

#endif // MICA_VM_OBJECTS_INSTANCE_HPP
