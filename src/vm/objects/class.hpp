#ifndef MICA_VM_OBJECTS_CLASS_HPP
#define MICA_VM_OBJECTS_CLASS_HPP

#include "vm/objects/object.hpp"

#include <absl/container/flat_hash_map.h>

#include <string>

namespace mica::vm {

/// A class with a name, at most one base class and a table of fields (attributes and methods).
/// The class of a class is its metaclass.
class Class final : public Object {
public:
    using FieldTable = absl::flat_hash_map<std::string, Value>;

    /// Creates a new class.
    ///
    /// `base` defaults to the universal base class and `metaclass` to the default metaclass.
    /// The metaclass must be the default metaclass or one of its subclasses.
    /// Both must belong to `ctx`.
    static Class& make(Context& ctx, std::string name, Class* base = nullptr,
        FieldTable fields = {}, Class* metaclass = nullptr);

    const std::string& name() const { return name_; }

    /// The parent class. Only null for the universal base class.
    Class* base() const { return base_; }

    /// The class this class is an instance of.
    Class* metaclass() const { return class_of(); }

    /// The fields defined directly on this class (inherited fields are not included).
    const FieldTable& fields() const { return fields_; }

    /// Returns the value of a field defined directly on this class.
    std::optional<Value> find_field(std::string_view name) const;

    /// Defines or overwrites a field of this class.
    void set_field(std::string_view name, Value value);

private:
    friend Heap;
    friend TypeSystem;

    Class(Context& ctx, std::string name, Class* base, FieldTable fields, Class* metaclass);

private:
    std::string name_;
    Class* base_;
    FieldTable fields_;
};

} // namespace mica::vm

#endif // MICA_VM_OBJECTS_CLASS_HPP
