#pragma once

#include <stack-core/fwd.hh>
#include <stack-core/macros.hh>

namespace sc
{
/// Error of the checked append operations (sc::stack_vec::try_push).
/// The container already holds its compile-time capacity N.
struct not_enough_space
{
    [[nodiscard]] friend constexpr bool operator==(not_enough_space, not_enough_space) { return true; }
};

/// Error of sc::stack_vec::try_insert.
/// index_out_of_range takes precedence: it is reported even if the container is also full.
enum class insert_error
{
    index_out_of_range, // idx < 0 or idx > len()
    not_enough_space,   // len() == N
};

[[nodiscard]] constexpr char const* to_string(not_enough_space)
{
    return "not enough space";
}

[[nodiscard]] constexpr char const* to_string(insert_error e)
{
    switch (e)
    {
    case insert_error::index_out_of_range:
        return "index out of range";
    case insert_error::not_enough_space:
        return "not enough space";
    }
    SC_BUILTIN_UNREACHABLE;
}
} // namespace sc
