#pragma once

// Lean header: no string or format dependencies, include it everywhere.
// For formatted assertions use <path-core/assertf.hh>.
#include <path-core/macros.hh>

#include <source_location>

namespace pc
{
/// Source code location (file, line, column, function) captured at assertion sites
using source_location = std::source_location;
} // namespace pc

// =========================================================================================================
// PC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime. On failure the active assertion handler is called,
// then the debugger is signalled (if attached) and the process aborts.
//
// When assertions are active:
//   Enabled in PC_DEBUG and PC_RELWITHDEBINFO builds.
//   In PC_RELEASE builds they are stripped unless PC_ENABLE_ASSERT_IN_RELEASE is set.
//
// Assertions guard caller contracts (e.g. indices passed to byte_string::operator[]).
// They are NOT used for input validation: over-length paths, unencodable text or paths outside
// the base directory are reported through the bool returned by the try_create_* factories.
//
// Usage:
//   PC_ASSERT(ptr != nullptr, "pointer must not be null");
//   PC_ASSERT(0 <= i && i < size(), "index out of bounds");
//
#define PC_ASSERT(cond, msg) PC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// PC_ASSERT_ALWAYS - Always-active assertion
//
// Like PC_ASSERT but active in all build configurations.
// Used where a violated contract would read or write out of bounds.
//
#define PC_ASSERT_ALWAYS(cond, msg) PC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// PC_DEBUG_BREAK - Break into the debugger if one is attached, otherwise no-op
//
#define PC_DEBUG_BREAK() PC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// PC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define PC_BREAK_AND_ABORT() (PC_DEBUG_BREAK(), ::pc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace pc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler, or prints to stderr if none is installed
// Note: does not abort, caller must follow with PC_BREAK_AND_ABORT()
PC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, pc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace pc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef PC_COMPILER_MSVC

#define PC_IMPL_DEBUG_BREAK() (::pc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(PC_COMPILER_POSIX)

// SIGTRAP is 5, see https://man7.org/linux/man-pages/man7/signal.7.html
// raise is declared here to keep posix headers out of every translation unit
extern "C" int raise(int) noexcept;
#define PC_IMPL_DEBUG_BREAK() (::pc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define PC_IMPL_DEBUG_BREAK() void(0)

#endif

#define PC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::pc::impl::handle_assert_failure(#cond, msg, ::pc::source_location::current()); \
            PC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if PC_ASSERT_ENABLED

#define PC_IMPL_ASSERT(cond, msg) PC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the message still has to compile
#define PC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        PC_UNUSED(cond);          \
        PC_UNUSED(msg);           \
    } while (false)

#endif
