#pragma once

#include <long-bytes/function_ref.hh>
#include <long-bytes/fwd.hh>
#include <long-bytes/span.hh>
#include <long-bytes/unique_array.hh>

#include <memory>
#include <string>
#include <variant>

/// Shared handle to any array of this library: either a long_byte_array (direct storage) or a
/// linked_byte_array (a view onto another handle).
///
/// This is the common surface every consumer programs against (views, array_reader, io helpers).
/// Each operation is dispatched explicitly to the alternative currently held; there is no virtual
/// interface. Copies of an array_ref share the referenced array.
///
/// A default-constructed array_ref is empty. Creating a view over an empty handle, or calling any
/// array operation on it, fails with lb::error_kind::null_base.
///
/// Usage:
///   lb::array_ref arr = lb::long_byte_array::create(1 << 20);
///   lb::array_ref tail = lb::linked_byte_array::create(arr, 1000, 24);
///   tail.put(0, lb::byte(1)); // arr.get(1000) == 1
struct lb::array_ref
{
    array_ref() = default;

    /// null pointers produce an empty handle
    array_ref(std::shared_ptr<long_byte_array> array);
    array_ref(std::shared_ptr<linked_byte_array> view);

    // alternatives
public:
    [[nodiscard]] bool is_valid() const { return _target.index() != 0; }
    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    /// true if this refers to a linked_byte_array
    [[nodiscard]] bool is_view() const { return std::holds_alternative<std::shared_ptr<linked_byte_array>>(_target); }

    /// the referenced long_byte_array, nullptr if empty or a view
    [[nodiscard]] std::shared_ptr<long_byte_array> as_array() const;

    /// the referenced linked_byte_array, nullptr if empty or a direct array
    [[nodiscard]] std::shared_ptr<linked_byte_array> as_view() const;

    // array operations, forwarded to the referenced array
public:
    [[nodiscard]] isize length() const;
    [[nodiscard]] byte get(isize index) const;
    void put(isize index, byte value) const;
    void put_range(isize offset, lb::span<byte const> data) const;
    [[nodiscard]] lb::unique_array<byte> get_sub_array(isize offset, isize count) const;
    [[nodiscard]] lb::unique_array<byte> to_regular_array() const;
    void write(lb::byte_sink sink) const;
    [[nodiscard]] std::string to_string() const;

private:
    std::variant<std::monostate, std::shared_ptr<long_byte_array>, std::shared_ptr<linked_byte_array>> _target;

    template <class F>
    decltype(auto) dispatch(F&& f) const;
};
