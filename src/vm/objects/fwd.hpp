#ifndef MICA_VM_OBJECTS_FWD_HPP
#define MICA_VM_OBJECTS_FWD_HPP

#include "common/defs.hpp"

namespace mica::vm {

enum class ValueType : u8;
class Value;

class Function;
class BoundMethod;
class Descriptor;

enum class ObjectKind : u8;
class Object;
class Class;
class Instance;

class Layout;
class LayoutTable;

} // namespace mica::vm

#endif // MICA_VM_OBJECTS_FWD_HPP
