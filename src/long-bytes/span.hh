#pragma once

#include <long-bytes/assert.hh>
#include <long-bytes/fwd.hh>

#include <concepts>
#include <type_traits>

namespace lb::impl
{
template <class T>
constexpr bool is_span = false;
template <class T>
constexpr bool is_span<lb::span<T>> = true;
} // namespace lb::impl

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size.
/// Used as the interop surface for byte buffers: construction input, sink chunks and reader targets.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
template <class T>
struct lb::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        LB_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Mutable to const conversion, e.g. span<byte> -> span<byte const>.
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<U const, T>)
    constexpr span(span<U> other) : _data(other.data()), _size(other.size())
    {
    }

    /// Creates a span from any container providing .data() and .size().
    /// The container must outlive the span.
    template <class Container>
        requires(!impl::is_span<std::remove_cvref_t<Container>>) && requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        LB_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // subviews
public:
    /// Returns the first `count` elements.
    /// Precondition: 0 <= count <= size().
    [[nodiscard]] constexpr span first(isize count) const
    {
        LB_ASSERT(0 <= count && count <= _size, "first() count out of bounds");
        return span(_data, count);
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
