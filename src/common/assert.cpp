#include "common/assert.hpp"

#include "common/error.hpp"

#include <fmt/format.h>

#include <cstring>

namespace mica {

namespace detail {

static std::string
format_failure(const SourceLocation& loc, std::string_view what, const char* message) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "{}", what);
    if (message && std::strlen(message) > 0)
        fmt::format_to(std::back_inserter(buf), ": {}", message);
    if (loc)
        fmt::format_to(std::back_inserter(buf), "\n    (in {}:{})", loc.file, loc.line);
    return fmt::to_string(buf);
}

void assert_fail(const SourceLocation& loc, const char* condition, const char* message) {
    raise_internal(format_failure(loc, fmt::format("Assertion `{}` failed", condition), message));
}

void unreachable(const SourceLocation& loc, const char* message) {
    raise_internal(format_failure(loc, "Unreachable code executed", message));
}

} // namespace detail
} // namespace mica
