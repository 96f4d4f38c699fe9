#pragma once

// Lean on purpose: every stack-core header includes this one.
// Formatted messages (SC_ASSERTF, SC_ASSERTF_ALWAYS) live in <stack-core/assertf.hh>.
#include <stack-core/macros.hh>
#include <stack-core/source_location.hh>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// SC_ASSERT(cond, msg)
//   Checks a precondition or invariant. Active when SC_ASSERT_ENABLED is 1, i.e. in debug and
//   relwithdebinfo builds, and in release builds configured with SC_ENABLE_ASSERT_IN_RELEASE.
//   Inactive asserts still type-check cond and msg but evaluate neither.
//   This is the only check performed by the *_unchecked members of sc::stack_vec.
//
// SC_ASSERT_ALWAYS(cond, msg)
//   Same report, active in every build configuration.
//
// On failure the expression, message and call site are passed to the topmost handler registered via
// sc::impl::scoped_assertion_handler (default: print to stderr with a stacktrace). If the handler
// returns, the process breaks into an attached debugger and aborts. A handler may throw instead,
// which unwinds out of the failing call (tests do this to observe panics).
//
// msg must be a string literal (or any char const*).
//
// Which failures are assertions:
//   - SC_ASSERT          -> broken preconditions of unchecked calls, bad indices into spans
//   - SC_ASSERTF_ALWAYS  -> capacity and index violations of the panicking stack_vec calls
//   - sc::result / sc::optional (no assertion at all) -> failures of try_* calls
//
#define SC_ASSERT(cond, msg) SC_IMPL_ASSERT(cond, msg)
#define SC_ASSERT_ALWAYS(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)

// breaks into the debugger if one is attached, no-op otherwise
#define SC_DEBUG_BREAK() SC_IMPL_DEBUG_BREAK()

// end of every failed assertion whose handler did not throw
#define SC_BREAK_AND_ABORT() (SC_DEBUG_BREAK(), ::sc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sc::impl
{
// reports to the topmost assertion handler, returns only if the handler returns
SC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, sc::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace sc::impl

#if defined(SC_COMPILER_MSVC)

// __debugbreak() without a debugger would terminate on its own
#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SC_COMPILER_POSIX)

// SIGTRAP (5) without pulling <csignal> into every header
extern "C" int raise(int) noexcept;
#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SC_IMPL_DEBUG_BREAK() void(0)

#endif

#define SC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::sc::impl::handle_assert_failure(#cond, msg, ::sc::source_location::current()); \
            SC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if SC_ASSERT_ENABLED
#define SC_IMPL_ASSERT(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define SC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SC_UNUSED(cond);          \
        SC_UNUSED(msg);           \
    } while (false)
#endif
