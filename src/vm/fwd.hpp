#ifndef MICA_VM_FWD_HPP
#define MICA_VM_FWD_HPP

namespace mica::vm {

class Context;
struct ContextSettings;
class Heap;
class TypeSystem;

} // namespace mica::vm

#endif // MICA_VM_FWD_HPP
