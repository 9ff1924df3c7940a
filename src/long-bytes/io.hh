#pragma once

#include <long-bytes/array_ref.hh>
#include <long-bytes/function_ref.hh>
#include <long-bytes/fwd.hh>

#include <memory>

// =========================================================================================================
// Stream adapters
// =========================================================================================================
//
// write() on any array produces a raw dump without length prefix. These helpers provide the inverse
// (rebuilding an array from a byte source given the length out of band) and file variants of both.
//
//   read_array(source, length, block_size)  - build a long_byte_array from a byte_source
//   write_file(array, path)                  - dump an array into a file
//   read_file(path, length, block_size)      - rebuild an array from a file

namespace lb
{
/// Reads exactly `length` bytes from `source` into a new array, block by block through put_range.
///   invalid_argument  if length < 0 or block_size <= 0
///   truncated_source  if the source ends before `length` bytes were delivered
///   io_failure        if the source reports failure or claims more bytes than requested
[[nodiscard]] std::shared_ptr<long_byte_array> read_array(lb::byte_source source, isize length, i32 block_size = lb::default_block_size);

/// Writes all bytes of `array` to the file at `path`, replacing its contents.
/// io_failure if the file cannot be opened or written.
void write_file(array_ref const& array, char const* path);

/// Reads the first `length` bytes of the file at `path` into a new array.
/// io_failure if the file cannot be opened or read, truncated_source if it is shorter than `length`.
[[nodiscard]] std::shared_ptr<long_byte_array> read_file(char const* path, isize length, i32 block_size = lb::default_block_size);
} // namespace lb
