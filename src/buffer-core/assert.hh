#pragma once

// This is a very lean header with minimal dependencies - easy to include everywhere and low cost.
#include <buffer-core/macros.hh>
#include <buffer-core/source_location.hh>

// =========================================================================================================
// Contract violations
//
// Every failed check in buffer-core is reported as one of these kinds.
//
//   assertion           -> an internal invariant or a low-level precondition (BC_ASSERT, BC_ASSERT_ALWAYS)
//   index_out_of_range  -> an index or range argument outside the currently valid bound (BC_CHECK_INDEX)
//   capacity_exceeded   -> the requested capacity does not fit the index space (BC_CHECK_CAPACITY)
//
// All checks run BEFORE the guarded operation mutates anything, so a handler that throws
// (see <buffer-core/assert-handler.hh>) unwinds with the container unchanged.
//
namespace bc
{
enum class violation
{
    assertion,
    index_out_of_range,
    capacity_exceeded,
};
} // namespace bc

// =========================================================================================================
// BC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Enabled in BC_DEBUG and BC_RELWITHDEBINFO builds.
//   In BC_RELEASE builds, assertions are disabled unless BC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Invariants, preconditions and postconditions of the implementation itself.
//   They catch PROGRAMMER ERRORS early during development.
//
// Error handling strategy:
//   - BC_ASSERT            -> internal invariants, debug-only
//   - BC_CHECK_INDEX       -> caller passed an index/range outside the valid bound, always active
//   - BC_CHECK_CAPACITY    -> caller requested more capacity than the index space holds, always active
//
// Usage:
//   BC_ASSERT(p != nullptr, "slot pointer must not be null");
//   BC_ASSERT(from <= to, "invalid slot range");
//
#define BC_ASSERT(cond, msg) BC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// BC_ASSERT_ALWAYS - Always-active assertion
//
// Like BC_ASSERT but remains active in all build configurations, including release builds.
//
// Usage:
//   BC_ASSERT_ALWAYS(p != nullptr, "allocation failed");
//
#define BC_ASSERT_ALWAYS(cond, msg) BC_IMPL_CHECK(::bc::violation::assertion, cond, msg)

// =========================================================================================================
// BC_CHECK_INDEX / BC_CHECK_CAPACITY - Contract checks of the public container API
//
// Always active. Reported with their own violation kind so handlers can tell them apart.
//
// Usage:
//   BC_CHECK_INDEX(0 <= idx && idx < size(), "index out of range");
//   BC_CHECK_CAPACITY(min_required <= max_capacity, "requested capacity exceeds the index space");
//
#define BC_CHECK_INDEX(cond, msg) BC_IMPL_CHECK(::bc::violation::index_out_of_range, cond, msg)
#define BC_CHECK_CAPACITY(cond, msg) BC_IMPL_CHECK(::bc::violation::capacity_exceeded, cond, msg)

// =========================================================================================================
// BC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define BC_DEBUG_BREAK() BC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// BC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define BC_BREAK_AND_ABORT() (BC_DEBUG_BREAK(), ::bc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace bc::impl
{
// Called when a check fails
// Dispatches to the topmost assertion handler or prints diagnostic information to stderr
// Note: does not abort, caller must follow with BC_BREAK_AND_ABORT()
BC_COLD_FUNC void handle_assert_failure(bc::violation kind,
                                        char const* expression,
                                        char const* message,
                                        bc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace bc::impl

// Platform-specific debugger break implementation
// The debugger should break right in the check macro, so this cannot hide in a function call

#ifdef BC_COMPILER_MSVC

#define BC_IMPL_DEBUG_BREAK() (::bc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(BC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define BC_IMPL_DEBUG_BREAK() (::bc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define BC_IMPL_DEBUG_BREAK() void(0)

#endif

#define BC_IMPL_CHECK(kind, cond, msg)                                                             \
    do                                                                                             \
    {                                                                                              \
        if (!(cond)) [[unlikely]]                                                                  \
        {                                                                                          \
            ::bc::impl::handle_assert_failure(kind, #cond, msg, ::bc::source_location::current()); \
            BC_BREAK_AND_ABORT();                                                                  \
        }                                                                                          \
    } while (false)

#if BC_ASSERT_ENABLED

#define BC_IMPL_ASSERT(cond, msg) BC_IMPL_CHECK(::bc::violation::assertion, cond, msg)

#else

// In release builds without BC_ENABLE_ASSERT_IN_RELEASE, assertions are stripped
// We still check that the expression and message compile
#define BC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        BC_UNUSED(cond);          \
        BC_UNUSED(msg);           \
    } while (false)

#endif
