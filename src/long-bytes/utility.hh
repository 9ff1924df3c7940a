#pragma once

#include <long-bytes/assert.hh>
#include <long-bytes/fwd.hh>

#include <functional>
#include <type_traits>

// =========================================================================================================
// Utility functions used throughout long-bytes
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Integer division:
//   int_div_round_up(nom, denom) - divide integers and round up (nom >= 0, denom > 0)
//
// Callables:
//   invoke(f, args...)          - uniform call syntax (functions, lambdas, member pointers)
//   is_invocable_r<R, F, Args>  - whether invoke(f, args...) is convertible to R
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Scope utilities:
//   LB_DEFER { code }           - execute code at scope-exit
//

namespace lb
{
/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] LB_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] LB_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] LB_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto ptr = lb::exchange(p, nullptr);     // take ownership of p, set p to null
template <class T, class U = T>
[[nodiscard]] LB_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = lb::forward<U>(new_val);
    return old_val;
}

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b;
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a;
}

/// Divide integers and round up: ceil(nom / denom)
/// Precondition: nom >= 0 && denom > 0
/// Usage:
///   auto blocks = lb::int_div_round_up(length, isize(block_size));
///   // int_div_round_up(2500, 1000) == 3
///   // int_div_round_up(0, 1000) == 0
template <class T>
[[nodiscard]] constexpr T int_div_round_up(T nom, T denom)
{
    LB_ASSERT(nom >= 0 && denom > 0, "int_div_round_up requires nom >= 0 and denom > 0");
    return nom / denom + (nom % denom != 0 ? 1 : 0);
}

/// Invoke any callable with the given arguments
template <class F, class... Args>
LB_FORCE_INLINE constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    return std::invoke(lb::forward<F>(f), lb::forward<Args>(args)...);
}

template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Type alias for readable function pointer types
///   lb::function_ptr<bool(void*, lb::isize)> -> bool (*)(void*, lb::isize)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(lb::forward<F>(f));
}
} // namespace impl

/// Execute code at scope-exit (RAII-style cleanup)
/// Captures by reference - be careful with lifetime
/// Usage:
///   auto* f = std::fopen(path, "rb");
///   LB_DEFER { std::fclose(f); };
#define LB_DEFER auto const LB_MACRO_JOIN(_lb_deferred_, __COUNTER__) = ::lb::impl::deferred_tag{} + [&]

} // namespace lb
