#pragma once

#include <long-bytes/assert.hh>
#include <long-bytes/fwd.hh>
#include <long-bytes/utility.hh>

// =========================================================================================================
// Block arithmetic
// =========================================================================================================
//
// An element at index i of an array with block size B lives in block (i / B) at position (i % B).
// These are the only places where that mapping is computed; the block store, the array engine and
// the stream adapters all go through them.
//
// The free functions are unchecked with respect to the array length. The checked variants that
// report lb::error_kind::out_of_range are long_byte_array::block_index / index_in_block.

namespace lb
{
/// block that contains element `index`
[[nodiscard]] constexpr isize block_index(isize index, i32 block_size)
{
    LB_ASSERT(index >= 0 && block_size > 0, "block_index requires a non-negative index and a positive block size");
    return index / block_size;
}

/// position of element `index` inside its block, in [0, block_size)
[[nodiscard]] constexpr i32 index_in_block(isize index, i32 block_size)
{
    LB_ASSERT(index >= 0 && block_size > 0, "index_in_block requires a non-negative index and a positive block size");
    return i32(index % block_size);
}

/// first element index of block `block`
[[nodiscard]] constexpr isize block_start(isize block, i32 block_size)
{
    return block * block_size;
}

/// highest block index an array of `length` elements can touch
/// 0 for empty arrays, which touch no block at all
[[nodiscard]] constexpr isize max_block_index(isize length, i32 block_size)
{
    return length <= 0 ? 0 : block_index(length - 1, block_size);
}

/// number of blocks needed to materialize all of an array of `length` elements
[[nodiscard]] constexpr isize max_block_count(isize length, i32 block_size)
{
    return lb::int_div_round_up(length, isize(block_size));
}
} // namespace lb

// =========================================================================================================
// Argument checks shared by all array types
// =========================================================================================================
//
// Each throws lb::array_error at the caller's source location if the check fails.

namespace lb::impl
{
/// out_of_range unless 0 <= index < length
void check_index(isize index, isize length, lb::source_location site = lb::source_location::current());

/// validates a sub-range request (offset, count) against an array of `length` elements:
///   out_of_range     unless 0 <= offset < length
///   invalid_argument if count < 0
///   too_large        if count > max_buffer_size
///   out_of_range     if offset + count > length
void check_sub_range(isize offset, isize count, isize length, lb::source_location site = lb::source_location::current());

/// out_of_range unless [offset, offset + count) lies within [0, length), count may be 0
void check_write_range(isize offset, isize count, isize length, lb::source_location site = lb::source_location::current());

/// too_large if an array of `length` elements cannot be materialized into one buffer
void check_single_buffer(isize length, lb::source_location site = lb::source_location::current());
} // namespace lb::impl
