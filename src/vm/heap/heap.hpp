#ifndef MICA_VM_HEAP_HEAP_HPP
#define MICA_VM_HEAP_HEAP_HPP

#include "common/defs.hpp"
#include "vm/objects/object.hpp"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace mica::vm {

/// Owns all objects allocated within a context. Objects are never collected; they are
/// destroyed together with the heap.
class Heap final {
public:
    Heap();
    ~Heap();

    /// Allocates a new object of type `T`. The returned reference remains valid for the lifetime of the heap.
    template<typename T, typename... Args>
    T& create(Args&&... args) {
        static_assert(std::is_base_of_v<Object, T>, "T must be an object type.");
        std::unique_ptr<T> object(new T(std::forward<Args>(args)...));
        T& result = *object;
        objects_.push_back(std::move(object));
        return result;
    }

    /// Number of objects allocated so far.
    size_t object_count() const { return objects_.size(); }

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

private:
    std::vector<std::unique_ptr<Object>> objects_;
};

} // namespace mica::vm

#endif // MICA_VM_HEAP_HEAP_HPP
