#include "common/error.hpp"

#include <cstdio>
#include <cstdlib>

namespace mica {

namespace detail {

void throw_error_impl(
    const SourceLocation& loc, errc code, const char* format, fmt::format_args args) {
    fmt::memory_buffer buf;
    if (code == errc::internal && loc) {
        fmt::format_to(
            std::back_inserter(buf), "Error in {} ({}:{}): ", loc.function, loc.file, loc.line);
    }
    fmt::vformat_to(std::back_inserter(buf), format, args);

    if (code == errc::internal)
        raise_internal(fmt::to_string(buf));
    throw Error(code, fmt::to_string(buf));
}

void raise_internal(std::string message) {
#ifdef MICA_THROW_ON_INTERNAL_ERROR
    throw InternalError(std::move(message));
#else
    fmt::print(stderr, "{}\n", message);
    std::fflush(stderr);
    std::abort();
#endif
}

} // namespace detail

Error::Error(errc code, std::string message)
    : code_(code)
    , message_(std::move(message)) {}

Error::~Error() {}

errc Error::code() const noexcept {
    return code_;
}

const char* Error::what() const noexcept {
    return message_.c_str();
}

InternalError::InternalError(std::string message)
    : message_(std::move(message)) {}

InternalError::~InternalError() {}

const char* InternalError::what() const noexcept {
    return message_.c_str();
}

AttributeNotFound::AttributeNotFound(std::string name)
    : Error(errc::attribute_not_found, fmt::format("attribute '{}' not found", name))
    , name_(std::move(name)) {}

const char* name(errc e) {
    switch (e) {
#define MICA_ERRC_NAME(X) \
    case errc::X:         \
        return #X;

        MICA_ERRC_NAME(ok)
        MICA_ERRC_NAME(bad_type)
        MICA_ERRC_NAME(bad_arg)
        MICA_ERRC_NAME(attribute_not_found)
        MICA_ERRC_NAME(internal)

#undef MICA_ERRC_NAME
    }
    return "<invalid error code>";
}

const char* message(errc e) {
    switch (e) {
    case errc::ok:
        return "No error.";
    case errc::bad_type:
        return "Operation not supported on type.";
    case errc::bad_arg:
        return "Invalid argument.";
    case errc::attribute_not_found:
        return "Attribute does not exist on object.";
    case errc::internal:
        return "Internal error.";
    }
    return "<invalid error code>";
}

} // namespace mica
