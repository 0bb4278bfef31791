#pragma once

// Lean header: included by every container header, so it must stay cheap.
// Only string literal messages are supported.
#include <micro-map/macros.hh>

#include <source_location>

namespace mm
{
/// Source position of an assertion site (file, line, column, function)
using source_location = std::source_location;
} // namespace mm

// =========================================================================================================
// MM_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime. On failure the active assertion handler is called, then the
// program breaks into an attached debugger and aborts.
//
// When assertions are active:
//   Enabled in MM_DEBUG and MM_RELWITHDEBINFO builds.
//   In MM_RELEASE builds they are stripped unless MM_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Preconditions and invariants the caller is responsible for, i.e. PROGRAMMER ERRORS:
//   out-of-bounds indices, popping from an empty container, value() on an empty optional,
//   at() with a key that is not in the map.
//
// What assertions are NOT for:
//   Expected outcomes. A lookup miss or removing an absent key returns nullptr / nullopt.
//
// Usage:
//   MM_ASSERT(0 <= i && i < size(), "index out of bounds");
//   MM_ASSERT(!empty(), "cannot pop from empty container");
//
#define MM_ASSERT(cond, msg) MM_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// MM_ASSERT_ALWAYS - Always-active assertion
//
// Like MM_ASSERT but never stripped, including release builds.
// Used for capacity exhaustion: writing past the inline storage would corrupt the stack,
// so an insert into a full fixed_map or fixed_vector is checked in every build mode.
//
// Usage:
//   MM_ASSERT_ALWAYS(size() < N, "capacity exceeded");
//
#define MM_ASSERT_ALWAYS(cond, msg) MM_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// MM_DEBUG_BREAK - Break into the debugger if one is attached, otherwise no-op
//
#define MM_DEBUG_BREAK() MM_IMPL_DEBUG_BREAK()

// =========================================================================================================
// MM_BREAK_AND_ABORT - Debug break (if attached) followed by program termination
//
#define MM_BREAK_AND_ABORT() (MM_DEBUG_BREAK(), ::mm::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace mm::impl
{
// Called when an assertion fails
// Dispatches to the topmost custom handler or prints to stderr
// Note: does not abort, caller must follow with MM_BREAK_AND_ABORT()
MM_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, mm::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace mm::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef MM_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define MM_IMPL_DEBUG_BREAK() (::mm::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(MM_COMPILER_POSIX)

// raise(SIGTRAP) instead of __builtin_trap(), which would crash without a debugger
// NOTE: declared here to avoid pulling <csignal> into every header; SIGTRAP is 5 on all POSIX targets we support
extern "C" int raise(int) noexcept;
#define MM_IMPL_DEBUG_BREAK() (::mm::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define MM_IMPL_DEBUG_BREAK() void(0)

#endif

#define MM_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::mm::impl::handle_assert_failure(#cond, msg, ::mm::source_location::current()); \
            MM_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if MM_ASSERT_ENABLED

#define MM_IMPL_ASSERT(cond, msg) MM_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg must still compile
#define MM_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        MM_UNUSED(cond);          \
        MM_UNUSED(msg);           \
    } while (false)

#endif
