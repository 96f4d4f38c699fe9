#pragma once

#include <stack-core/source_location.hh>

#include <functional>
#include <string>

namespace sc::impl
{
/// Everything a handler learns about a failed assertion.
/// For the panicking stack_vec calls, message is the formatted text, e.g.
/// "insertion index (is 5) should be <= len (is 2)".
struct assertion_info
{
    std::string expression;
    std::string message;
    sc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

// Handlers form a stack; the topmost one receives every failure.
// With an empty stack, failures are printed to stderr together with a stacktrace.
// A handler that returns lets the process abort; a handler that throws unwinds out of the failing call.
// The stack is global and not synchronized.
void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

/// Pushes a handler for the lifetime of this object.
/// Usage:
///   auto handler = sc::impl::scoped_assertion_handler([](sc::impl::assertion_info const& info)
///                                                     { throw my_panic{info.message}; });
///   vec.push(x); // throws my_panic instead of aborting if vec is full
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace sc::impl
