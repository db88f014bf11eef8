#pragma once

#include <path-core/assert.hh>

#include <format>
#include <string>

// =========================================================================================================
// PC_ASSERTF - Runtime assertion with std::format message
//
// Formatted variant of PC_ASSERT. Arguments are only evaluated when the condition fails.
// Same activation rules as PC_ASSERT.
//
// Usage:
//   PC_ASSERTF(size >= 0, "size must be non-negative, got {}", size);
//   PC_ASSERTF(i < size(), "index {} out of bounds (size: {})", i, size());
//
#define PC_ASSERTF(cond, msg, ...) PC_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// PC_ASSERTF_ALWAYS - Always-active assertion with formatted message
//
#define PC_ASSERTF_ALWAYS(cond, msg, ...) PC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define PC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::pc::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::pc::source_location::current());                          \
            PC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if PC_ASSERT_ENABLED

#define PC_IMPL_ASSERTF(cond, msg, ...) PC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

#define PC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        PC_UNUSED(cond);                                        \
        PC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
