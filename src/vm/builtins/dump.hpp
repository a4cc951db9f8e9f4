#ifndef MICA_VM_BUILTINS_DUMP_HPP
#define MICA_VM_BUILTINS_DUMP_HPP

#include "vm/objects/fwd.hpp"

#include <string>

namespace mica::vm {

/// Dumps `value` into a string suitable for debugging.
///
/// Instances list their attributes in slot order, classes list their name, base class and
/// their own fields (sorted by name). Nested objects are dumped recursively.
/// Objects that have already been visited on the current path are printed as `...`.
///
/// NOTE: The format of a dump is not stable.
std::string dump(const Value& value, bool pretty = false);

} // namespace mica::vm

#endif // MICA_VM_BUILTINS_DUMP_HPP
