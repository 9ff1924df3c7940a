#pragma once

// Lean header, safe to include from every other header in the library.
#include <long-bytes/fwd.hh>
#include <long-bytes/macros.hh>

// =========================================================================================================
// LB_ASSERT - Runtime assertion with string literal message
//
// Checks an internal invariant and runs the assertion handler, then breaks into an attached
// debugger and aborts if it does not hold.
//
// Assertions guard invariants the library maintains itself (block sizes, window arithmetic,
// liveness of handles after successful construction). Argument validation of public entry points
// is NOT done with assertions: bad indices, lengths and offsets are reported as lb::array_error
// (see <long-bytes/error.hh>) because callers must be able to observe and test them.
//
// Active when LB_ASSERT_ENABLED is 1 (LB_DEBUG, LB_RELWITHDEBINFO or LB_ENABLE_ASSERT_IN_RELEASE).
//
// Usage:
//   LB_ASSERT(block.size() == block_size, "blocks always span the full block size");
//
#define LB_ASSERT(cond, msg) LB_IMPL_ASSERT(cond, msg)

// LB_ASSERT_ALWAYS - Like LB_ASSERT but active in every build configuration
#define LB_ASSERT_ALWAYS(cond, msg) LB_IMPL_ASSERT_ALWAYS(cond, msg)

// LB_DEBUG_BREAK - Breaks into the debugger if one is attached, no-op otherwise
#define LB_DEBUG_BREAK() LB_IMPL_DEBUG_BREAK()

// LB_BREAK_AND_ABORT - Debug break followed by program termination
#define LB_BREAK_AND_ABORT() (LB_DEBUG_BREAK(), ::lb::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace lb::impl
{
// Called when an assertion fails
// Dispatches to the topmost handler (see <long-bytes/assert-handler.hh>) or prints to stderr
// Note: does not abort, caller must follow with LB_BREAK_AND_ABORT()
LB_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, lb::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace lb::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef LB_COMPILER_MSVC

#define LB_IMPL_DEBUG_BREAK() (::lb::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(LB_COMPILER_POSIX)

// SIGTRAP is 5, declared here to avoid pulling posix headers into every TU
extern "C" int raise(int) noexcept;
#define LB_IMPL_DEBUG_BREAK() (::lb::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define LB_IMPL_DEBUG_BREAK() void(0)

#endif

#define LB_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::lb::impl::handle_assert_failure(#cond, msg, ::lb::source_location::current()); \
            LB_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if LB_ASSERT_ENABLED

#define LB_IMPL_ASSERT(cond, msg) LB_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expressions must still compile
#define LB_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        LB_UNUSED(cond);          \
        LB_UNUSED(msg);           \
    } while (false)

#endif
