#ifndef MICA_COMMON_FORMAT_HPP
#define MICA_COMMON_FORMAT_HPP

#include "common/defs.hpp"

#include <fmt/format.h>

#include <string_view>
#include <type_traits>

/// Opt into fmt support for a type that has a free `to_string(obj)` function
/// (found via argument dependent lookup) returning a string or string_view.
///
/// The macro invocation must be in the global namespace.
#define MICA_ENABLE_FREE_TO_STRING(...)                     \
    template<>                                              \
    struct mica::EnableFreeToString<__VA_ARGS__> : std::true_type {};

namespace mica {

template<typename T, typename Enable = void>
struct EnableFreeToString : std::false_type {};

namespace detail {

template<typename T>
auto call_free_to_string(const T& value) {
    return to_string(value);
}

} // namespace detail
} // namespace mica

template<typename T, typename Char>
struct fmt::formatter<T, Char, std::enable_if_t<mica::EnableFreeToString<T>::value>>
    : fmt::formatter<std::string_view, Char> {

    template<typename FormatContext>
    auto format(const T& value, FormatContext& ctx) const {
        const auto& str = mica::detail::call_free_to_string(value);
        return fmt::formatter<std::string_view, Char>::format(std::string_view(str), ctx);
    }
};

#endif // MICA_COMMON_FORMAT_HPP
