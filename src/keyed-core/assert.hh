#pragma once

// Lean header with minimal dependencies, included by every container header.
#include <keyed-core/macros.hh>
#include <keyed-core/source_location.hh>

// =========================================================================================================
// KC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// Active when KC_ASSERT_ENABLED is 1 (debug, relwithdebinfo, or KC_ENABLE_ASSERT_IN_RELEASE).
//
// What assertions are for:
//   INVARIANTS, PRECONDITIONS and POSTCONDITIONS of the low-level building blocks
//   (vector and span bounds, the ordered_map slot/entry correspondence).
//
// What assertions are NOT for:
//   Conditions a caller may legitimately run into and recover from.
//   ordered_map reports those as kc::map_error exceptions (see <keyed-core/errors.hh>):
//     - duplicate keys, missing keys, out-of-range positions, negative capacities
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - Exceptions      -> caller-recoverable failures of the public ordered_map API
//
// Usage:
//   KC_ASSERT(ptr != nullptr, "pointer must not be null");
//   KC_ASSERT(0 <= i && i < size(), "index out of bounds");
//
#define KC_ASSERT(cond, msg) KC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// KC_ASSERT_ALWAYS - Always-active assertion
//
// Like KC_ASSERT but remains active in all build configurations, including release builds.
//
#define KC_ASSERT_ALWAYS(cond, msg) KC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// KC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline (not in a function) so the debugger stops at the assertion site.
//
#define KC_DEBUG_BREAK() KC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// KC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define KC_BREAK_AND_ABORT() (KC_DEBUG_BREAK(), ::kc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace kc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints to stderr if there is none)
// Note: does not abort, caller must follow with KC_BREAK_AND_ABORT()
KC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, kc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace kc::impl

#ifdef KC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define KC_IMPL_DEBUG_BREAK() (::kc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(KC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here so no posix header leaks into every container header
extern "C" int raise(int) noexcept;
#define KC_IMPL_DEBUG_BREAK() (::kc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define KC_IMPL_DEBUG_BREAK() void(0)

#endif

#define KC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::kc::impl::handle_assert_failure(#cond, msg, ::kc::source_location::current()); \
            KC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if KC_ASSERT_ENABLED

#define KC_IMPL_ASSERT(cond, msg) KC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message must still compile
#define KC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        KC_UNUSED(cond);          \
        KC_UNUSED(msg);           \
    } while (false)

#endif
