#ifndef MICA_ERROR_HPP_INCLUDED
#define MICA_ERROR_HPP_INCLUDED

namespace mica {

/// Defines all possible error codes.
enum class errc : int {
    /// Success
    ok = 0,

    /// Operation not supported on type
    bad_type = 1,

    /// Invalid argument
    bad_arg = 2,

    /// Attribute could not be resolved on object
    attribute_not_found = 3,

    /// Internal error (broken invariant or primitive misuse)
    internal = 1000,
};

/// Returns the name of the given error code.
/// The returned string is allocated in static storage.
const char* name(errc e);

/// Returns the human readable message associated with the error code.
/// The returned string is allocated in static storage.
const char* message(errc e);

} // namespace mica

#endif // MICA_ERROR_HPP_INCLUDED
