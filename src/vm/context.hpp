#ifndef MICA_VM_CONTEXT_HPP
#define MICA_VM_CONTEXT_HPP

#include "common/defs.hpp"
#include "vm/fwd.hpp"
#include "vm/heap/heap.hpp"
#include "vm/objects/layout.hpp"
#include "vm/type_system.hpp"

#include <functional>
#include <string_view>

namespace mica::vm {

struct ContextSettings {
    /// Receives all diagnostic output. Defaults to printing to stdout.
    std::function<void(std::string_view message)> print_stdout;

    /// Report every newly created layout transition.
    bool trace_layouts = false;

    /// Report every dispatch to a miss hook or a write hook.
    bool trace_hooks = false;
};

/// The runtime state. Owns all objects, the layout cache and the bootstrap kernel.
///
/// Contexts are completely independent of each other. A context performs no internal
/// synchronization: concurrent use must be serialized by the caller.
class Context final {
public:
    Context();
    explicit Context(ContextSettings settings);

    ~Context();

    /// Settings set during construction. Valid defaults are ensured.
    const ContextSettings& settings() const { return settings_; }

    /// Arbitrary userdata.
    void* userdata() const { return userdata_; }
    void userdata(void* ptr) { userdata_ = ptr; }

    Heap& heap() { return heap_; }
    LayoutTable& layouts() { return layouts_; }
    TypeSystem& types() { return types_; }

    /// Writes the message to the configured output.
    void print(std::string_view message) const;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

private:
    ContextSettings settings_;
    void* userdata_ = nullptr;
    LayoutTable layouts_;
    Heap heap_;
    TypeSystem types_;
};

} // namespace mica::vm

#endif // MICA_VM_CONTEXT_HPP
