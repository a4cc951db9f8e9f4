#include "vm/builtins/dump.hpp"

#include "vm/objects/class.hpp"
#include "vm/objects/instance.hpp"
#include "vm/objects/value.hpp"

#include <absl/container/flat_hash_set.h>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string_view>
#include <vector>

namespace mica::vm {

namespace {

class DumpHelper final {
public:
    explicit DumpHelper(bool pretty)
        : pretty_(pretty) {}

    void visit(const Value& value) {
        if (!value.is_object()) {
            write(to_string(value));
            return;
        }

        Object& object = value.as_object();
        const bool inserted = seen_.insert(&object).second;
        if (!inserted) {
            write("...");
            return;
        }

        depth_ += 1;
        if (auto cls = object.try_as_class()) {
            dump_class(*cls);
        } else {
            dump_instance(object.as_instance());
        }
        depth_ -= 1;

        // Repeated occurrences in neighbor fields are fine, only cycles are cut.
        seen_.erase(&object);
    }

    std::string take() { return fmt::to_string(buf_); }

private:
    void dump_instance(Instance& instance) {
        Class* cls = instance.class_of();
        write(cls ? std::string_view(cls->name()) : "?"sv);

        const auto& names = instance.layout().names();
        auto storage = instance.storage();
        begin_group();
        for (size_t i = 0; i < names.size(); ++i) {
            entry(i, names[i]);
            visit(storage[i]);
        }
        end_group(names.size());
    }

    void dump_class(Class& cls) {
        write("class ");
        write(cls.name());
        if (Class* base = cls.base()) {
            write("(");
            write(base->name());
            write(")");
        }

        std::vector<std::string_view> names;
        names.reserve(cls.fields().size());
        for (const auto& entry : cls.fields())
            names.push_back(entry.first);
        std::sort(names.begin(), names.end());

        write(" ");
        begin_group();
        for (size_t i = 0; i < names.size(); ++i) {
            entry(i, names[i]);
            visit(*cls.find_field(names[i]));
        }
        end_group(names.size());
    }

    void begin_group() { write("{"); }

    void end_group(size_t entries) {
        if (pretty_ && entries > 0) {
            newline(depth_ - 1);
        }
        write("}");
    }

    void entry(size_t index, std::string_view name) {
        if (pretty_) {
            if (index > 0)
                write(",");
            newline(depth_);
        } else if (index > 0) {
            write(", ");
        }
        write(name);
        write(": ");
    }

    void newline(size_t depth) {
        write("\n");
        fmt::format_to(std::back_inserter(buf_), "{:{}}", "", depth * 4);
    }

    void write(std::string_view str) { buf_.append(str.data(), str.data() + str.size()); }

private:
    bool pretty_ = false;
    size_t depth_ = 0;
    absl::flat_hash_set<const Object*> seen_;
    fmt::memory_buffer buf_;
};

} // namespace

std::string dump(const Value& value, bool pretty) {
    DumpHelper helper(pretty);
    helper.visit(value);
    return helper.take();
}

} // namespace mica::vm
