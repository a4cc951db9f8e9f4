#include "vm/class_hierarchy.hpp"

#include "vm/objects/class.hpp"

namespace mica::vm {

// Single inheritance: the ancestor sequence is simply the chain of base classes.
template<typename Cls, typename Func>
static void walk_ancestors(Cls* cls, Func&& func) {
    for (; cls; cls = cls->base()) {
        if (!func(*cls))
            return;
    }
}

std::vector<Class*> ancestors(Class& cls) {
    std::vector<Class*> result;
    walk_ancestors(&cls, [&](Class& current) {
        result.push_back(&current);
        return true;
    });
    return result;
}

bool is_subclass(const Class& a, const Class& b) {
    bool found = false;
    walk_ancestors(&a, [&](const Class& current) {
        found = &current == &b;
        return !found;
    });
    return found;
}

bool is_instance(const Object& object, const Class& cls) {
    const Class* type = object.class_of();
    return type && is_subclass(*type, cls);
}

std::optional<Value> class_lookup(const Class& cls, std::string_view name) {
    std::optional<Value> result;
    walk_ancestors(&cls, [&](const Class& current) {
        result = current.find_field(name);
        return !result;
    });
    return result;
}

} // namespace mica::vm
