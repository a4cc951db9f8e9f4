#include "vm/objects/layout.hpp"

#include "common/error.hpp"

#include <fmt/format.h>

namespace mica::vm {

Layout::Layout(const LayoutTable& table)
    : table_(&table) {}

Layout::Layout(const Layout& parent, std::string name)
    : table_(parent.table_)
    , parent_(&parent)
    , names_(parent.names_)
    , slots_(parent.slots_) {
    const u32 slot = static_cast<u32>(names_.size());
    slots_.emplace(name, slot);
    names_.push_back(std::move(name));
}

std::optional<u32> Layout::slot_of(std::string_view name) const {
    if (auto pos = slots_.find(absl::string_view(name.data(), name.size())); pos != slots_.end())
        return pos->second;
    return {};
}

const Layout* Layout::find_transition(std::string_view name) const {
    if (auto pos = transitions_.find(absl::string_view(name.data(), name.size())); pos != transitions_.end())
        return pos->second.get();
    return nullptr;
}

LayoutTable::LayoutTable()
    : root_(new Layout(*this)) {}

LayoutTable::~LayoutTable() {}

const Layout& LayoutTable::extend(const Layout& layout, std::string_view name) {
    MICA_CHECK(&layout.table() == this, "Cannot extend a layout that belongs to another table.");
    MICA_CHECK(!layout.slot_of(name),
        "Cannot extend a layout with attribute '{}': the name already occupies slot {}.", name,
        *layout.slot_of(name));

    if (auto existing = layout.find_transition(name))
        return *existing;

    std::unique_ptr<Layout> successor(new Layout(layout, std::string(name)));
    const Layout& result = *successor;
    layout.transitions_.emplace(std::string(name), std::move(successor));
    ++layout_count_;

    if (on_transition_)
        on_transition_(layout, result);
    return result;
}

std::string describe(const Layout& layout) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "{{");
    for (u32 slot = 0; slot < layout.size(); ++slot) {
        if (slot > 0)
            fmt::format_to(std::back_inserter(buf), ", ");
        fmt::format_to(std::back_inserter(buf), "{}: {}", layout.names()[slot], slot);
    }
    fmt::format_to(std::back_inserter(buf), "}}");
    return fmt::to_string(buf);
}

} // namespace mica::vm
