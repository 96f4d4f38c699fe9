#pragma once

#include <stack-core/fwd.hh>
#include <stack-core/macros.hh>

#include <cstring>
#include <type_traits>

// =========================================================================================================
// Small building blocks shared by all stack-core headers
// =========================================================================================================
//
//   sc::move / sc::forward / sc::exchange   without <utility>
//   sc::min / sc::max                       by const reference, ties resolve to the first / second argument
//   sc::placement_new                       tag for the placement new overload at the end of this file
//   sc::storage_for<T>                      one uninitialized, aligned T (used by sc::optional)
//   sc::memcpy / sc::memmove                byte copies with isize sizes, no-op for sizes <= 0
//   sc::sentinel                            end() marker of input ranges (stack_vec_into_iter)
//

namespace sc
{
template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Assigns new_val to obj and returns the previous value.
/// Usage:
///   auto const count = sc::exchange(_len, isize(0)); // take the live range, leave the source empty
template <class T, class U = T>
[[nodiscard]] SC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old = static_cast<T&&>(obj);
    obj = sc::forward<U>(new_val);
    return old;
}

template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return b < a ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return b < a ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Usage:
///   new (sc::placement_new, slot) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// Storage for one T whose lifetime is managed by the owner.
/// Never constructs or destroys value by itself.
/// Trivially copyable and destructible when T is.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    storage_for(storage_for const&) = default;
    storage_for(storage_for&&) = default;
    storage_for& operator=(storage_for const&) = default;
    storage_for& operator=(storage_for&&) = default;
};

/// Unlike std::memcpy, nullptr with size 0 is allowed.
SC_FORCE_INLINE void memcpy(void* dest, void const* src, isize size_bytes)
{
    if (size_bytes > 0)
        std::memcpy(dest, src, std::size_t(size_bytes));
}

/// Ranges may overlap. Unlike std::memmove, nullptr with size 0 is allowed.
SC_FORCE_INLINE void memmove(void* dest, void const* src, isize size_bytes)
{
    if (size_bytes > 0)
        std::memmove(dest, src, std::size_t(size_bytes));
}

// =========================================================================================================
// Ranges
// =========================================================================================================

/// end() of ranges whose iterator knows by itself when it is done.
struct sentinel
{
};
} // namespace sc

// placement new for sc::placement_new, so headers do not need <new>
[[nodiscard]] SC_FORCE_INLINE void* operator new(std::size_t, sc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}

// only called if a constructor inside a placement new throws
SC_FORCE_INLINE void operator delete(void*, sc::placement_new_t, void*) noexcept
{
}
