#pragma once

#include <cstddef>
#include <cstdint>
#include <source_location>


namespace lb
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// the element type of every array in this library
using byte = std::byte;

// signed size and index type
// Element indices, offsets and lengths are all isize, including the 64-bit element domain of
// long_byte_array. Subtracting offsets never wraps, and negative arguments stay detectable
// so they can be reported as errors instead of turning into huge positive indices.
using isize = i64;

/// Source location of a call site, captured for assertions and errors
using source_location = std::source_location;

//
// Limits
//

/// Block size used when none is given at construction
inline constexpr i32 default_block_size = 1000;

/// Largest buffer (in bytes) that can be materialized in one piece
/// Applies to get_sub_array, to_regular_array and block sizes, never to element indices
inline constexpr isize max_buffer_size = INT32_MAX;

//
// Views and utilities
//

template <class T>
struct span;

template <class Signature>
struct function_ref;

template <class T>
struct mutex;

template <class T>
struct unique_array;

//
// Arrays
//

enum class error_kind : u8;
struct array_error;

struct block_store;
struct long_byte_array;
struct linked_byte_array;
struct array_ref;

struct array_reader;

//
// Streaming
//

/// Receives consecutive chunks of an array in index order, returns false to reject a chunk
using byte_sink = function_ref<bool(span<byte const>)>;

/// Fills the given buffer from the front, returns the number of bytes delivered,
/// 0 at end of data and a negative value on failure
using byte_source = function_ref<isize(span<byte>)>;

} // namespace lb
