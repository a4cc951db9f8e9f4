#ifndef MICA_COMMON_ERROR_HPP
#define MICA_COMMON_ERROR_HPP

#include "common/defs.hpp"
#include "mica/error.hpp"

#include <fmt/format.h>

#include <exception>
#include <string>

namespace mica {

/// Base class of all recoverable errors thrown by the library.
/// Broken invariants inside the runtime are reported by raise_internal() instead.
class Error : public virtual std::exception {
public:
    explicit Error(errc code, std::string message);
    virtual ~Error();

    errc code() const noexcept;
    const char* what() const noexcept override;

private:
    errc code_;
    std::string message_;
};

/// Raised when an attribute cannot be resolved: no stored value, no class-side value and
/// no miss hook that produced a result.
class AttributeNotFound final : public Error {
public:
    explicit AttributeNotFound(std::string name);

    /// The name of the attribute that was requested.
    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// Signals a broken invariant inside the runtime (e.g. primitive misuse or a broken bootstrap).
/// Only thrown by builds that define MICA_THROW_ON_INTERNAL_ERROR, all other builds abort.
/// Not derived from Error, so handlers for runtime errors never observe it.
class InternalError final : public virtual std::exception {
public:
    explicit InternalError(std::string message);
    virtual ~InternalError();

    errc code() const noexcept { return errc::internal; }
    const char* what() const noexcept override;

private:
    std::string message_;
};

namespace detail {

[[noreturn]] MICA_DISABLE_INLINE MICA_COLD void throw_error_impl(
    const SourceLocation& loc, errc code, const char* format, fmt::format_args args);

/// Raises an internal error with a fully formatted message: prints the message and aborts
/// the process, or throws an InternalError if built with MICA_THROW_ON_INTERNAL_ERROR.
[[noreturn]] MICA_DISABLE_INLINE MICA_COLD void raise_internal(std::string message);

} // namespace detail

/// Raises an internal error (see raise_internal()). The arguments to the macro are interpreted
/// like in fmt::format().
#define MICA_ERROR(...) \
    (::mica::throw_error(MICA_SOURCE_LOCATION(), ::mica::errc::internal, __VA_ARGS__))

/// Throws an error with the given code. The arguments are interpreted like in fmt::format().
#define MICA_ERROR_WITH_CODE(code, ...) \
    (::mica::throw_error(MICA_SOURCE_LOCATION(), (code), __VA_ARGS__))

/// Evaluates a condition and, if the condition evaluates to false, raises an internal error.
/// All other arguments are passed to MICA_ERROR().
#define MICA_CHECK(cond, ...)         \
    do {                              \
        if (MICA_UNLIKELY(!(cond))) { \
            MICA_ERROR(__VA_ARGS__);  \
        }                             \
    } while (0)

/// Throws an error with the provided source location.
template<typename... Args>
[[noreturn]] inline MICA_COLD void
throw_error(const SourceLocation& loc, errc code, const char* format, const Args&... args) {
    detail::throw_error_impl(loc, code, format, fmt::make_format_args(args...));
}

} // namespace mica

#endif // MICA_COMMON_ERROR_HPP
