#include "vm/objects/instance.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"
#include "vm/context.hpp"
#include "vm/objects/class.hpp"

namespace mica::vm {

Instance& Instance::make(Context& ctx, Object& cls) {
    MICA_CHECK(cls.is_class(), "Cannot instantiate an object of kind {}, a class is required.",
        cls.kind());
    MICA_CHECK(cls.owned_by(ctx), "Cannot instantiate class '{}' of another context.",
        cls.as_class().name());
    return ctx.heap().create<Instance>(ctx, cls.as_class(), ctx.layouts().empty());
}

Instance::Instance(Context& ctx, Class& cls, const Layout& layout)
    : Object(ctx, ObjectKind::Instance, &cls)
    , layout_(&layout) {
    MICA_DEBUG_ASSERT(layout.empty(), "New instances must start with the empty layout.");
}

std::optional<Value> Instance::get(std::string_view name) const {
    if (auto slot = layout_->slot_of(name)) {
        MICA_DEBUG_ASSERT(*slot < storage_.size(), "Storage must be aligned with the layout.");
        return storage_[*slot];
    }
    return {};
}

void Instance::set(LayoutTable& layouts, std::string_view name, Value value) {
    if (auto slot = layout_->slot_of(name)) {
        storage_[*slot] = std::move(value);
        return;
    }

    const Layout& next = layouts.extend(*layout_, name);
    MICA_DEBUG_ASSERT(next.size() == storage_.size() + 1, "Extension must add exactly one slot.");
    storage_.push_back(std::move(value));
    layout_ = &next;
}

} // namespace mica::vm
