#pragma once

#include <long-bytes/fwd.hh>
#include <long-bytes/utility.hh>

#include <type_traits>

/// Non-owning reference to a callable object with signature R(Args...)
///
/// This is how long-bytes accepts caller-provided sinks and sources (see lb::byte_sink and
/// lb::byte_source in <long-bytes/fwd.hh>): a lambda is passed directly and only has to
/// live for the duration of the call.
///
/// IMPORTANT LIFETIME RULE:
///   function_ref never owns. Any referenced callable object must outlive the function_ref.
///
/// Usage example:
///   std::vector<lb::byte> out;
///   arr.write([&](lb::span<lb::byte const> chunk) {
///       out.insert(out.end(), chunk.begin(), chunk.end());
///       return true;
///   });
///
/// Properties:
///   - Trivially copyable (no destructor, no heap allocations)
///   - Default constructible (creates invalid/null state)
template <class R, class... Args>
struct lb::function_ref<R(Args...)>
{
    // internal storage
private:
    void* _payload = nullptr;
    lb::function_ptr<R(void*, Args...)> _thunk = nullptr;

    // construction
public:
    /// default constructor creates an invalid/null function_ref
    function_ref() = default;

    /// construct from any callable
    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref>)
    function_ref(F&& f) : _payload(const_cast<void*>(static_cast<void const*>(&f)))
    {
        static_assert(lb::is_invocable_r<R, F&, Args...>, "F must be callable with Args... and return R");

        using Fn = std::remove_reference_t<F>;
        // NOLINTBEGIN
        _thunk = [](void* p, Args... args) -> R { return lb::invoke(*static_cast<Fn*>(p), lb::forward<Args>(args)...); };
        // NOLINTEND
    }

    function_ref(function_ref const&) = default;
    function_ref(function_ref&&) = default;
    function_ref& operator=(function_ref const&) = default;
    function_ref& operator=(function_ref&&) = default;
    ~function_ref() = default;

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }
    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    /// precondition: is_valid()
    R operator()(Args... args) const
    {
        LB_ASSERT(_thunk != nullptr, "calling invalid function_ref is UB");
        return _thunk(_payload, lb::forward<Args>(args)...);
    }
};
