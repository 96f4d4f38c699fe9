#pragma once

#include <stack-core/fwd.hh>
#include <stack-core/utility.hh>

#include <type_traits>

namespace sc::impl
{
/// Calls destructors on [start, end) in index order.
/// start == end (including two nullptrs) does nothing.
/// No code is emitted for trivially destructible T.
template <class T>
constexpr void destroy_objects(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (start != end)
        {
            start->~T();
            ++start;
        }
    }
}

/// Moves objects from [src_start, src_end) into uninitialized memory and ends the lifetime of the sources.
/// Afterwards [*dest_end_before, dest_end) is live and [src_start, src_end) is uninitialized memory.
/// This is how ownership of a live range changes hands (container move, conversion into the consuming iterator).
/// Source and destination ranges must not overlap.
/// Trivially copyable types are optimized to a single memcpy at compile time.
template <class T>
constexpr void relocate_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        sc::memcpy(dest_end, src_start, size * isize(sizeof(T)));
        dest_end += size;
    }
    else
    {
        while (src_start != src_end)
        {
            new (sc::placement_new, dest_end) T(sc::move(*src_start));
            src_start->~T();
            ++dest_end;
            ++src_start;
        }
    }
}

/// Shifts the live range [start, end) one slot toward the back.
/// IMPORTANT: *end must be uninitialized memory and start != end.
/// Afterwards [start + 1, end + 1) holds the original values in original order and *start is alive
/// but moved-from (ready to be assigned). For trivially copyable types this is a single memmove.
/// O(end - start).
template <class T>
constexpr void shift_objects_back_by_one(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T> && std::is_move_assignable_v<T>,
                  "T must be move constructible and move assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        sc::memmove(start + 1, start, (end - start) * isize(sizeof(T)));
    }
    else
    {
        // the last element moves into uninitialized memory, the rest are assignments
        new (sc::placement_new, end) T(sc::move(*(end - 1)));
        for (auto p = end - 1; p != start; --p)
            *p = sc::move(*(p - 1));
    }
}

/// Compacts [src_start, src_end) backward so that it starts at dest (dest < src_start, all alive).
/// Move-assigns element by element in index order; for trivially copyable types this is a single memmove.
/// Afterwards the trailing (src_start - dest) objects are alive but moved-from; the caller destroys them.
/// O(src_end - src_start).
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        sc::memmove(dest, src_start, (src_end - src_start) * isize(sizeof(T)));
    }
    else
    {
        while (src_start != src_end)
        {
            *dest = sc::move(*src_start);
            ++dest;
            ++src_start;
        }
    }
}
} // namespace sc::impl
