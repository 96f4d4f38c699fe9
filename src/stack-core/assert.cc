#include "assert.hh"

#include <stack-core/assert-handler.hh>
#include <stack-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>
#include <vector>

#ifdef SC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// NOTE: not synchronized, see assert-handler.hh
std::vector<sc::impl::assertion_handler> g_handlers;

void print_assertion_failure(sc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "[stack-core] assertion failed: " << info.expression << '\n'
              << "  message:  " << info.message << '\n'
              << "  location: " << loc.file_name() << ':' << loc.line() << ':' << loc.column() << '\n'
              << "  function: " << loc.function_name() << '\n';

    std::cerr << "\nstacktrace:\n" << std::to_string(sc::stacktrace::current(1)) << std::endl;
}

#ifdef SC_OS_LINUX
// "TracerPid:\t<pid>" in /proc/self/status is non-zero while a debugger is attached
bool has_tracer_pid()
{
    auto const f = std::fopen("/proc/self/status", "r");
    if (!f)
        return false;

    auto pid = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), f))
    {
        if (std::strncmp(line, "TracerPid:", 10) == 0)
        {
            if (std::sscanf(line + 10, "%d", &pid) != 1)
                pid = 0;
            break;
        }
    }
    std::fclose(f);
    return pid != 0;
}
#endif
} // namespace

void sc::impl::push_assertion_handler(assertion_handler handler)
{
    g_handlers.push_back(std::move(handler));
}

void sc::impl::pop_assertion_handler()
{
    SC_ASSERT_ALWAYS(!g_handlers.empty(), "pop_assertion_handler without a matching push");
    g_handlers.pop_back();
}

sc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

sc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

void sc::impl::handle_assert_failure(char const* expression, char const* message, sc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (g_handlers.empty())
        print_assertion_failure(info);
    else
        g_handlers.back()(info);
}

bool sc::impl::is_debugger_connected() noexcept
{
#if defined(SC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(SC_OS_LINUX)
    return has_tracer_pid();
#else
    return false;
#endif
}

void sc::impl::perform_abort() noexcept
{
    std::abort();
}
