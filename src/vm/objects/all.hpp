#ifndef MICA_VM_OBJECTS_ALL_HPP
#define MICA_VM_OBJECTS_ALL_HPP

#include "vm/objects/class.hpp"
#include "vm/objects/function.hpp"
#include "vm/objects/instance.hpp"
#include "vm/objects/layout.hpp"
#include "vm/objects/object.hpp"
#include "vm/objects/value.hpp"

#endif // MICA_VM_OBJECTS_ALL_HPP
