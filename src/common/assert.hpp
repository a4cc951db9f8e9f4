#ifndef MICA_COMMON_ASSERT_HPP
#define MICA_COMMON_ASSERT_HPP

#include "common/defs.hpp"

namespace mica {

namespace detail {

[[noreturn]] MICA_DISABLE_INLINE MICA_COLD void
assert_fail(const SourceLocation& loc, const char* cond, const char* message);

[[noreturn]] MICA_DISABLE_INLINE MICA_COLD void
unreachable(const SourceLocation& loc, const char* message);

} // namespace detail

#ifdef MICA_DEBUG

/// Checks a condition that is guaranteed by construction. Compiled out in release builds.
#    define MICA_DEBUG_ASSERT(cond, message)                            \
        do {                                                            \
            if (MICA_UNLIKELY(!(cond))) {                               \
                [loc = MICA_SOURCE_LOCATION()] {                        \
                    ::mica::detail::assert_fail(loc, #cond, (message)); \
                }();                                                    \
            }                                                           \
        } while (0)

#    define MICA_UNREACHABLE(message) \
        (::mica::detail::unreachable(MICA_SOURCE_LOCATION(), (message)))

#else
#    define MICA_DEBUG_ASSERT(cond, message)
#    define MICA_UNREACHABLE(message) (::mica::detail::unreachable(MICA_SOURCE_LOCATION(), nullptr))
#endif

} // namespace mica

#endif // MICA_COMMON_ASSERT_HPP
