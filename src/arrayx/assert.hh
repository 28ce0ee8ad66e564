#pragma once

// Lean header with minimal dependencies, included by every arrayx header.
#include <arrayx/macros.hh>
#include <arrayx/source_location.hh>

// =========================================================================================================
// AX_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// Features:
//   - Simple string literal error messages
//   - Automatic source location capture (file, line, function)
//   - Debugger integration: breaks into debugger when attached, otherwise aborts
//   - Active in debug and release-with-debug-info builds by default
//
// When assertions are active:
//   See AX_ASSERT_ENABLED in <arrayx/macros.hh>.
//
// Assertions vs. ax::error:
//   Assertions guard arrayx's own INVARIANTS (a span indexed past its end by library code,
//   a matrix coordinate computed wrongly). They are programmer errors in arrayx or in code
//   that uses a raw view incorrectly.
//   Bad arguments to the public array operations (empty input for median, slice bounds,
//   percentile outside [0, 100], ...) are NOT assertions: they throw ax::error, see <arrayx/error.hh>.
//
// Usage:
//   AX_ASSERT(i < size(), "index out of bounds");
//   AX_ASSERT(rows * cols == isize(cells.size()), "matrix storage out of sync");
//
#define AX_ASSERT(cond, msg) AX_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// AX_ASSERT_ALWAYS - Always-active assertion
//
// Like AX_ASSERT but remains active in all build configurations, including release builds.
//
#define AX_ASSERT_ALWAYS(cond, msg) AX_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// AX_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define AX_DEBUG_BREAK() AX_IMPL_DEBUG_BREAK()

// =========================================================================================================
// AX_BREAK_AND_ABORT - Debug break followed by program termination
//
#define AX_BREAK_AND_ABORT() (AX_DEBUG_BREAK(), ::ax::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ax::impl
{
// Called when an assertion fails
// Forwards to the topmost assertion handler (default: report to stderr)
// Note: does not abort, caller must follow with AX_BREAK_AND_ABORT()
AX_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ax::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ax::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef AX_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define AX_IMPL_DEBUG_BREAK() (::ax::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(AX_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here to avoid pulling a posix header into every arrayx header
extern "C" int raise(int) noexcept;
#define AX_IMPL_DEBUG_BREAK() (::ax::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define AX_IMPL_DEBUG_BREAK() void(0)

#endif

#define AX_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ax::impl::handle_assert_failure(#cond, msg, ::ax::source_location::current()); \
            AX_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if AX_ASSERT_ENABLED

#define AX_IMPL_ASSERT(cond, msg) AX_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define AX_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AX_UNUSED(cond);          \
        AX_UNUSED(msg);           \
    } while (false)

#endif
