#ifndef MICA_COMMON_DEFS_HPP
#define MICA_COMMON_DEFS_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace mica {

using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f64 = double;

using std::size_t;

using std::literals::string_view_literals::operator""sv;

#if defined(__GNUC__) || defined(__clang__)
#    define MICA_LIKELY(x) (__builtin_expect(!!(x), 1))
#    define MICA_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#    define MICA_DISABLE_INLINE __attribute__((noinline))
#    define MICA_COLD __attribute__((cold))
#elif defined(_MSC_VER)
#    define MICA_LIKELY(x) (!!(x))
#    define MICA_UNLIKELY(x) (!!(x))
#    define MICA_DISABLE_INLINE __declspec(noinline)
#    define MICA_COLD
#else
#    define MICA_LIKELY(x) (x)
#    define MICA_UNLIKELY(x) (x)
#    define MICA_DISABLE_INLINE
#    define MICA_COLD
#endif

#if !defined(MICA_DEBUG) && !defined(NDEBUG)
#    define MICA_DEBUG 1
#endif

#ifdef MICA_DEBUG
#    define MICA_SOURCE_LOCATION() (::mica::SourceLocation{__FILE__, __LINE__, __func__})
#else
#    define MICA_SOURCE_LOCATION() (::mica::SourceLocation{})
#endif

/// Location of a check or error in the library's own source code.
/// Fields are null / 0 in release builds.
struct SourceLocation {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;

    constexpr SourceLocation() = default;

    constexpr SourceLocation(const char* file_, int line_, const char* function_)
        : file(file_)
        , line(line_)
        , function(function_) {}

    explicit constexpr operator bool() const { return file != nullptr; }
};

} // namespace mica

#endif // MICA_COMMON_DEFS_HPP
