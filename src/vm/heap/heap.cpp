#include "vm/heap/heap.hpp"

namespace mica::vm {

Heap::Heap() {}

Heap::~Heap() {}

} // namespace mica::vm
