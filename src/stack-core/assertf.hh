#pragma once

#include <stack-core/assert.hh>

#include <format>

// =========================================================================================================
// Formatted assertions
// =========================================================================================================
//
// SC_ASSERTF(cond, fmt, args...)          like SC_ASSERT, message built with std::format
// SC_ASSERTF_ALWAYS(cond, fmt, args...)   like SC_ASSERT_ALWAYS, message built with std::format
//
// The panicking members of sc::stack_vec report through SC_ASSERTF_ALWAYS so that the message names
// the offending index, length or capacity:
//   SC_ASSERTF_ALWAYS(idx < _len, "removal index (is {}) should be < len (is {})", idx, _len);
//
// args are only evaluated when cond is false.
//
#define SC_ASSERTF(cond, msg, ...) SC_IMPL_ASSERTF(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#define SC_ASSERTF_ALWAYS(cond, msg, ...) SC_IMPL_ASSERTF_ALWAYS(cond, msg __VA_OPT__(, ) __VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define SC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::sc::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::sc::source_location::current());                          \
            SC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if SC_ASSERT_ENABLED
#define SC_IMPL_ASSERTF(cond, msg, ...) SC_IMPL_ASSERTF_ALWAYS(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#else
// the format string is still checked at compile time
#define SC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        SC_UNUSED(cond);                                        \
        SC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)
#endif
