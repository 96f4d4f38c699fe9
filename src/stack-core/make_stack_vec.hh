#pragma once

#include <stack-core/fwd.hh>
#include <stack-core/stack_vec.hh>
#include <stack-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// Factories for stack_vec literals
// =========================================================================================================
//
//   make_stack_vec<T, N>()                   - empty stack_vec<T, N>
//   make_stack_vec<N>(a, b, c)               - stack_vec<T, N> holding a, b, c (element count checked at compile time)
//   make_stack_vec_full(a, b, c)             - stack_vec<T, 3> holding a, b, c
//   make_stack_vec_filled<N>(value, count)   - stack_vec<T, N> holding count copies of value
//
// T is the decayed type of the first element; the remaining elements must be convertible to it.
//

namespace sc
{
template <class T, isize N>
[[nodiscard]] stack_vec<T, N> make_stack_vec()
{
    return stack_vec<T, N>();
}

/// Usage:
///   auto v = sc::make_stack_vec<8>(1, 2, 3); // stack_vec<int, 8> with len 3
template <isize N, class T, class... Rest>
[[nodiscard]] stack_vec<std::decay_t<T>, N> make_stack_vec(T&& first, Rest&&... rest)
{
    static_assert(1 + isize(sizeof...(Rest)) <= N, "too many elements for the requested stack_vec capacity");
    static_assert((std::is_constructible_v<std::decay_t<T>, Rest&&> && ...), "all elements must convert to the first element's type");

    stack_vec<std::decay_t<T>, N> v;
    v.emplace_unchecked(sc::forward<T>(first));
    (v.emplace_unchecked(sc::forward<Rest>(rest)), ...);
    return v;
}

/// Capacity equals the number of elements, so the result is always full.
template <class T, class... Rest>
[[nodiscard]] stack_vec<std::decay_t<T>, 1 + isize(sizeof...(Rest))> make_stack_vec_full(T&& first, Rest&&... rest)
{
    return make_stack_vec<1 + isize(sizeof...(Rest))>(sc::forward<T>(first), sc::forward<Rest>(rest)...);
}

/// Calls SC_ASSERTF_ALWAYS if count > N.
template <isize N, class T>
[[nodiscard]] stack_vec<T, N> make_stack_vec_filled(T const& value, isize count)
{
    stack_vec<T, N> v;
    v.extend_with(count, value);
    return v;
}
} // namespace sc
