#pragma once

#include <long-bytes/array_ref.hh>
#include <long-bytes/function_ref.hh>
#include <long-bytes/fwd.hh>
#include <long-bytes/span.hh>
#include <long-bytes/unique_array.hh>

#include <memory>
#include <string>

/// Zero-copy view of the elements [offset, offset + length) of another array.
///
/// Element i of the view is element offset + i of its base. The view has no storage and no lock
/// of its own: every operation is forwarded to the base, so writes through a view are visible
/// through the base and through every other view aliasing the same elements, and thread-safety
/// is that of the long_byte_array at the end of the chain.
///
/// The base may itself be a view; offsets of a chain add up. The view keeps its base alive.
///
/// Indices are checked against the view's own [0, length()) first (out_of_range); errors raised by
/// the base are propagated unchanged and report base coordinates.
///
/// Usage:
///   auto arr = lb::long_byte_array::create(100);
///   auto mid = lb::linked_byte_array::create(arr, 40, 20);
///   auto inner = lb::linked_byte_array::create(mid, 5, 10);
///   inner->put(0, lb::byte(7)); // arr->get(45) == 7
struct lb::linked_byte_array
{
    // factories
public:
    /// null_base    if `base` is empty
    /// out_of_range if offset < 0, length < 0 or offset + length > base.length()
    [[nodiscard]] static std::shared_ptr<linked_byte_array> create(array_ref base, isize offset, isize length);

    // element access
public:
    [[nodiscard]] byte get(isize index) const;
    void put(isize index, byte value);
    void put_range(isize offset, lb::span<byte const> data);

    // bulk access
public:
    /// forwards to base.get_sub_array(offset() + offset, count) after checking against this view
    [[nodiscard]] lb::unique_array<byte> get_sub_array(isize offset, isize count) const;

    /// base.get_sub_array(offset(), length()), too_large if length() > max_buffer_size
    [[nodiscard]] lb::unique_array<byte> to_regular_array() const;

    /// element by element in index order; a sink returning false aborts with io_failure
    /// An empty view never calls the sink.
    void write(lb::byte_sink sink) const;

    // queries
public:
    [[nodiscard]] isize length() const { return _length; }
    [[nodiscard]] isize offset() const { return _offset; }

    /// the array this view projects
    [[nodiscard]] array_ref const& linked_to() const { return _base; }

    /// "linked_byte_array[0,<length - 1>] at offset <offset> -> <base description>"
    [[nodiscard]] std::string to_string() const;

private:
    struct private_tag
    {
    };

public:
    /// only reachable through create()
    linked_byte_array(private_tag, array_ref base, isize offset, isize length);

    linked_byte_array(linked_byte_array const&) = delete;
    linked_byte_array& operator=(linked_byte_array const&) = delete;

private:
    array_ref _base;
    isize _offset;
    isize _length;
};
