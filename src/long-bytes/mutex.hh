#pragma once

#include <long-bytes/fwd.hh>
#include <long-bytes/utility.hh>

#include <mutex>

/// Thread-safe wrapper for data T protected by a mutex
/// The data can only be reached through lock(), so every access is inside a critical section.
/// long_byte_array keeps its block table in one of these; the lock is per instance, never global.
template <class T>
struct lb::mutex
{
    /// Acquire lock, invoke function with protected value, and return result
    /// The mutex is held for the duration of the function call
    /// Returns: The result of invoking f with the protected value (auto to prevent reference leaks)
    /// Usage:
    ///   lb::mutex<int> counter;
    ///   counter.lock([](int& val) { val++; });
    ///   int current = counter.lock([](int const& val) { return val; });
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard lock(_mutex);
        return lb::invoke(lb::forward<F>(f), _value);
    }

    /// Const access, for read-only queries on a const owner
    template <class F>
    auto lock(F&& f) const
    {
        std::lock_guard lock(_mutex);
        return lb::invoke(lb::forward<F>(f), static_cast<T const&>(_value));
    }

    mutex() = default;

    template <class... Args>
    explicit mutex(Args&&... args) : _value(lb::forward<Args>(args)...)
    {
    }

    mutex(mutex const&) = delete;
    mutex& operator=(mutex const&) = delete;

private:
    T _value;
    mutable std::mutex _mutex;
};
