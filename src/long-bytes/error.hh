#pragma once

#include <long-bytes/fwd.hh>
#include <long-bytes/macros.hh>

#include <exception>
#include <string>
#include <string_view>

#ifndef LB_HAS_CPP_EXCEPTIONS
#error "long-bytes reports invalid arguments and failed I/O as lb::array_error exceptions"
#endif

/// Category of an lb::array_error
enum class lb::error_kind : lb::u8
{
    /// a view was created over an empty array_ref
    null_base,
    /// index, offset or length outside the declared bounds of an array or its base
    out_of_range,
    /// a non-index argument is invalid, e.g. a negative length or a non-positive block size
    invalid_argument,
    /// a single-buffer result would exceed lb::max_buffer_size
    too_large,
    /// a byte source ended before the declared length was read
    truncated_source,
    /// a sink rejected data or a source/file operation failed
    io_failure,
};

namespace lb
{
/// Returns the enumerator name, e.g. "out_of_range"
[[nodiscard]] std::string_view to_string(error_kind kind);
} // namespace lb

/// Error raised by every fallible long-bytes operation.
///
/// Errors are detected where the violation happens and surfaced to the immediate caller; nothing in
/// the library catches, logs or retries them. Views forward errors of their base unchanged, so the
/// message of an error raised through a view reports base coordinates.
///
/// Usage:
///   try { arr->get(-1); }
///   catch (lb::array_error const& e)
///   {
///       if (e.kind() == lb::error_kind::out_of_range) ...
///       std::cerr << e.to_string();
///   }
struct lb::array_error : std::exception
{
    array_error(error_kind kind, std::string message, lb::source_location site = lb::source_location::current());

    [[nodiscard]] error_kind kind() const { return _kind; }
    [[nodiscard]] std::string const& message() const { return _message; }
    [[nodiscard]] lb::source_location site() const { return _site; }

    [[nodiscard]] char const* what() const noexcept override { return _message.c_str(); }

    /// Multi-line description with kind, message and throw site:
    ///   error (out_of_range): index 2500 is out of bounds [0, 2500)
    ///     at src/long-bytes/long_byte_array.cc:42 - ...
    [[nodiscard]] std::string to_string() const;

private:
    error_kind _kind;
    std::string _message;
    lb::source_location _site;
};

namespace lb::impl
{
[[noreturn]] LB_COLD_FUNC void throw_error(error_kind kind, std::string message, lb::source_location site = lb::source_location::current());
} // namespace lb::impl
