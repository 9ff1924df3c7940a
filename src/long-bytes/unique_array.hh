#pragma once

#include <long-bytes/assert.hh>
#include <long-bytes/fwd.hh>
#include <long-bytes/span.hh>
#include <long-bytes/utility.hh>

#include <cstring>
#include <memory>
#include <type_traits>

/// Heap-allocated array of T with a size fixed at creation and move-only ownership.
/// No growth operations (push, pop, resize).
///
/// In long-bytes this is both the storage of a single block and the result type of every
/// operation that materializes a range into one buffer (get_sub_array, to_regular_array).
/// Restricted to trivially copyable T so copies and zero-fills are plain memory operations.
///
/// Usage:
///   auto block = lb::unique_array<lb::byte>::create_defaulted(1000); // all zero
///   block[17] = lb::byte(3);
///   auto copy = lb::unique_array<lb::byte>::create_copy_of(lb::span<lb::byte const>(block));
template <class T>
struct lb::unique_array
{
    static_assert(std::is_trivially_copyable_v<T>, "unique_array only supports trivially copyable types");

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        LB_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        LB_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] T* data() { return _data.get(); }
    [[nodiscard]] T const* data() const { return _data.get(); }

    // iterators
public:
    [[nodiscard]] T* begin() { return _data.get(); }
    [[nodiscard]] T* end() { return _data.get() + _size; }
    [[nodiscard]] T const* begin() const { return _data.get(); }
    [[nodiscard]] T const* end() const { return _data.get() + _size; }

    // queries
public:
    [[nodiscard]] bool empty() const { return _size == 0; }
    [[nodiscard]] isize size() const { return _size; }

    // factories
public:
    /// value-initialized elements, i.e. zero for arithmetic types and lb::byte
    [[nodiscard]] static unique_array create_defaulted(isize size)
    {
        LB_ASSERT(size >= 0, "size must be non-negative");
        if (size == 0)
            return {};
        return unique_array(std::make_unique<T[]>(size_t(size)), size);
    }

    /// contents are indeterminate until written, callers must overwrite every element
    [[nodiscard]] static unique_array create_uninitialized(isize size)
    {
        LB_ASSERT(size >= 0, "size must be non-negative");
        if (size == 0)
            return {};
        return unique_array(std::make_unique_for_overwrite<T[]>(size_t(size)), size);
    }

    /// deep copy of the given elements, the result never aliases `source`
    [[nodiscard]] static unique_array create_copy_of(lb::span<T const> source)
    {
        auto r = create_uninitialized(source.size());
        if (!source.empty())
            std::memcpy(r.data(), source.data(), size_t(source.size()) * sizeof(T));
        return r;
    }

    // unique_array has move-only semantics
public:
    unique_array() = default;

    unique_array(unique_array&& rhs) noexcept : _data(lb::move(rhs._data)), _size(lb::exchange(rhs._size, 0)) {}
    unique_array& operator=(unique_array&& rhs) noexcept
    {
        _data = lb::move(rhs._data);
        _size = lb::exchange(rhs._size, 0);
        return *this;
    }

private:
    unique_array(std::unique_ptr<T[]> data, isize size) : _data(lb::move(data)), _size(size) {}

    std::unique_ptr<T[]> _data;
    isize _size = 0;
};
