#pragma once

#include <long-bytes/fwd.hh>
#include <long-bytes/mutex.hh>
#include <long-bytes/span.hh>
#include <long-bytes/unique_array.hh>

#include <unordered_map>

/// Sparse mapping from block index to a fixed-size byte block, materialized on first write.
///
/// Addresses are element positions; the store derives block and in-block position itself via
/// <long-bytes/block_index.hh>. It does not know the array length: callers (long_byte_array)
/// validate positions before they get here. Positions must be non-negative (asserted).
///
/// Reads of an unmaterialized block observe zeros without creating the block. Every access to the
/// table, including the find-allocate-write sequence of a store, happens inside one lock of the
/// per-instance mutex, so concurrent first writes to the same block cannot lose updates.
struct lb::block_store
{
    using block = lb::unique_array<lb::byte>;
    using block_table = std::unordered_map<isize, block>;

    /// Precondition: block_size > 0
    explicit block_store(i32 block_size);

    block_store(block_store const&) = delete;
    block_store& operator=(block_store const&) = delete;

    // element access
public:
    /// value at `pos`, zero if its block was never materialized
    [[nodiscard]] byte load(isize pos) const;

    /// writes `value` at `pos`, materializing a zero-filled block first if needed
    void store(isize pos, byte value);

    /// copies `dst.size()` bytes starting at `pos` into `dst` under a single lock
    /// walks the touched blocks in index order, zero-filling for unmaterialized ones
    void load_range(isize pos, lb::span<byte> dst) const;

    /// writes all of `src` starting at `pos` under a single lock, materializing blocks as needed
    void store_range(isize pos, lb::span<byte const> src);

    /// copies the first `dst.size()` bytes of block `block_idx` into `dst`, zeros if unmaterialized
    /// Precondition: dst.size() <= block_size()
    void load_block(isize block_idx, lb::span<byte> dst) const;

    /// adopts `data` as block `block_idx`
    /// Precondition: data.size() == block_size() and the block is not materialized yet
    void adopt_block(isize block_idx, block data);

    // queries
public:
    [[nodiscard]] i32 block_size() const { return _block_size; }

    /// number of materialized blocks
    [[nodiscard]] isize block_count() const;

    [[nodiscard]] bool is_materialized(isize block_idx) const;

private:
    i32 _block_size;
    lb::mutex<block_table> _blocks;
};
