#pragma once

#include <long-bytes/block_store.hh>
#include <long-bytes/function_ref.hh>
#include <long-bytes/fwd.hh>
#include <long-bytes/span.hh>
#include <long-bytes/unique_array.hh>

#include <memory>
#include <string>

/// Byte array indexed by 64-bit positions whose storage is allocated lazily in fixed-size blocks.
///
/// The declared length and the block size are fixed at construction. Memory is only spent on
/// blocks that were written to; reading anywhere else yields zero. A long_byte_array of length
/// 2^40 with three written bytes owns three blocks.
///
/// All operations are thread-safe. Element indices are checked against [0, length()) and
/// violations are reported as lb::array_error (see <long-bytes/error.hh>).
///
/// Instances are shared: they are created through the factories below and handed out as
/// std::shared_ptr so that linked_byte_array views (and array_ref handles) can keep them alive.
///
/// Usage:
///   auto arr = lb::long_byte_array::create(2500, 1000);
///   arr->put(1000, lb::byte(9));
///   auto bytes = arr->get_sub_array(990, 20); // bytes[10] == 9, rest zero
///   arr->fill_factor();                       // 1 of 3 blocks: 0.333..
struct lb::long_byte_array
{
    // factories
public:
    /// Creates an array of `length` zero bytes with no block materialized.
    /// invalid_argument if length < 0 or block_size <= 0.
    [[nodiscard]] static std::shared_ptr<long_byte_array> create(isize length, i32 block_size = lb::default_block_size);

    /// Creates a single-block array holding a copy of `data`, with length == block size == data.size().
    /// The array owns its copy; later changes to `data` are not observed.
    /// An empty `data` yields an empty array with the default block size.
    /// too_large if data.size() > max_buffer_size.
    [[nodiscard]] static std::shared_ptr<long_byte_array> create_copy_of(lb::span<byte const> data);

    // element access
public:
    /// out_of_range unless 0 <= index < length()
    [[nodiscard]] byte get(isize index) const;

    /// out_of_range unless 0 <= index < length()
    /// materializes the containing block on first write
    void put(isize index, byte value);

    /// writes all of `data` starting at `offset`, materializing every touched block
    /// out_of_range unless [offset, offset + data.size()) lies within [0, length())
    void put_range(isize offset, lb::span<byte const> data);

    // bulk access
public:
    /// Copies [offset, offset + count) into a new buffer, block by block under one lock.
    /// Unmaterialized blocks are read as zeros and stay unmaterialized.
    ///   out_of_range     unless 0 <= offset < length()
    ///   invalid_argument if count < 0
    ///   too_large        if count > max_buffer_size
    ///   out_of_range     if offset + count > length()
    [[nodiscard]] lb::unique_array<byte> get_sub_array(isize offset, isize count) const;

    /// All elements in one buffer, too_large if length() > max_buffer_size
    [[nodiscard]] lb::unique_array<byte> to_regular_array() const;

    /// Streams every element in index order to `sink`, one chunk per block.
    /// Nothing is materialized. A sink returning false aborts with io_failure.
    /// An empty array never calls the sink.
    void write(lb::byte_sink sink) const;

    // queries
public:
    [[nodiscard]] isize length() const { return _length; }
    [[nodiscard]] i32 block_size() const { return _store.block_size(); }

    /// materialized blocks divided by the blocks the array could hold, 1.0 for empty arrays
    [[nodiscard]] f64 fill_factor() const;

    /// number of materialized blocks
    [[nodiscard]] isize block_count() const { return _store.block_count(); }

    /// highest block index, 0 for empty arrays
    [[nodiscard]] isize max_block_index() const;

    /// block holding element `index`, out_of_range unless 0 <= index < length()
    [[nodiscard]] isize block_index(isize index) const;

    /// position of element `index` inside its block, out_of_range unless 0 <= index < length()
    [[nodiscard]] i32 index_in_block(isize index) const;

    /// whether the block holding element `index` has been materialized
    [[nodiscard]] bool is_materialized(isize index) const;

    /// "long_byte_array[0,<length - 1>]"
    [[nodiscard]] std::string to_string() const;

private:
    struct private_tag
    {
    };

public:
    /// only reachable through the factories, which validate the arguments
    long_byte_array(private_tag, isize length, i32 block_size);

    long_byte_array(long_byte_array const&) = delete;
    long_byte_array& operator=(long_byte_array const&) = delete;
    long_byte_array(long_byte_array&&) = delete;
    long_byte_array& operator=(long_byte_array&&) = delete;

private:
    isize _length;
    lb::block_store _store;
};
