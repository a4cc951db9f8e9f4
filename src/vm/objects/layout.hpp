#ifndef MICA_VM_OBJECTS_LAYOUT_HPP
#define MICA_VM_OBJECTS_LAYOUT_HPP

#include "common/defs.hpp"
#include "vm/fwd.hpp"
#include "vm/objects/fwd.hpp"

#include <absl/container/flat_hash_map.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mica::vm {

/// Describes which attribute names occupy which storage slots of an instance
/// (also known as a "hidden class" or "map").
///
/// Layouts form a tree rooted at the empty layout: every layout except the root was derived
/// from its parent by appending exactly one attribute name at the next free slot.
/// The slot mapping of a layout never changes after it has been created, so all instances
/// that share a layout agree on the meaning of their slots.
/// Layouts are owned by their parent (the root is owned by the LayoutTable) and live
/// as long as the context.
class Layout final {
public:
    /// Returns the slot index of the given attribute name, or an empty optional
    /// if the name is not part of this layout.
    std::optional<u32> slot_of(std::string_view name) const;

    /// Number of slots (i.e. attribute names) in this layout.
    u32 size() const { return static_cast<u32>(names_.size()); }

    bool empty() const { return names_.empty(); }

    /// Attribute names in slot order.
    const std::vector<std::string>& names() const { return names_; }

    /// The layout this layout was derived from. Null for the empty root layout.
    const Layout* parent() const { return parent_; }

    /// The table that created this layout.
    const LayoutTable& table() const { return *table_; }

    /// Returns the cached successor for `name`, or null if it was never requested.
    const Layout* find_transition(std::string_view name) const;

    /// Number of successor layouts derived from this layout so far.
    size_t transition_count() const { return transitions_.size(); }

    Layout(const Layout&) = delete;
    Layout& operator=(const Layout&) = delete;

private:
    friend LayoutTable;

    explicit Layout(const LayoutTable& table);
    Layout(const Layout& parent, std::string name);

private:
    const LayoutTable* table_;
    const Layout* parent_ = nullptr;

    // Copied from the parent on creation for constant time slot lookup. The tree therefore
    // uses memory quadratic in the number of attributes per layout.
    std::vector<std::string> names_;
    absl::flat_hash_map<std::string, u32> slots_;

    // Grows when new successors are requested. Does not affect the slot mapping above.
    mutable absl::flat_hash_map<std::string, std::unique_ptr<Layout>> transitions_;
};

/// Owns the layout transition tree of a context and interns layouts:
/// extending the same layout with the same name always produces the identical successor.
///
/// The table performs no synchronization.
class LayoutTable final {
public:
    /// Called whenever a new layout was created by an extension.
    using TransitionCallback = std::function<void(const Layout& from, const Layout& to)>;

    LayoutTable();
    ~LayoutTable();

    /// The shared layout without any attributes. New instances start here.
    const Layout& empty() const { return *root_; }

    /// Returns the canonical successor of `layout` that additionally contains `name`
    /// at the next free slot. Repeated calls with the same arguments return the same layout.
    /// It is an internal error if `name` is already part of `layout` or if `layout`
    /// was created by another table.
    const Layout& extend(const Layout& layout, std::string_view name);

    /// Total number of layouts created by this table, including the empty layout.
    size_t layout_count() const { return layout_count_; }

    /// Installs a callback that observes newly created layouts (for tracing).
    void on_transition(TransitionCallback callback) { on_transition_ = std::move(callback); }

    LayoutTable(const LayoutTable&) = delete;
    LayoutTable& operator=(const LayoutTable&) = delete;

private:
    std::unique_ptr<Layout> root_;
    size_t layout_count_ = 1;
    TransitionCallback on_transition_;
};

/// Formats the slot mapping of `layout`, e.g. `{x: 0, y: 1}`.
std::string describe(const Layout& layout);

} // namespace mica::vm

#endif // MICA_VM_OBJECTS_LAYOUT_HPP
