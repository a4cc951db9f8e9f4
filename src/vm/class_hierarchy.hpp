#ifndef MICA_VM_CLASS_HIERARCHY_HPP
#define MICA_VM_CLASS_HIERARCHY_HPP

#include "vm/objects/fwd.hpp"
#include "vm/objects/value.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace mica::vm {

/// Returns the ancestor sequence of `cls`: `cls` itself, followed by its base class,
/// the base of that class, and so on up to the universal base class.
std::vector<Class*> ancestors(Class& cls);

/// True if `b` is part of the ancestor sequence of `a` (every class is a subclass of itself).
bool is_subclass(const Class& a, const Class& b);

/// True if `cls` is part of the ancestor sequence of the class of `object`.
bool is_instance(const Object& object, const Class& cls);

/// Searches the ancestor sequence of `cls` in order and returns the value of the first
/// field named `name`. Fields of subclasses therefore shadow fields of their ancestors.
std::optional<Value> class_lookup(const Class& cls, std::string_view name);

} // namespace mica::vm

#endif // MICA_VM_CLASS_HIERARCHY_HPP
