#pragma once

#include <stack-core/assert.hh>
#include <stack-core/fwd.hh>

#include <cstddef>
#include <type_traits>

/// Pointer + length view of contiguous Ts.
/// This is what stack-core hands out for reading:
///   stack_vec::as_span()             -> exactly the live range [0, len)
///   stack_vec_into_iter::as_span()   -> the elements not yet yielded
/// A span never owns anything and is invalidated by any mutation of the container it came from.
/// span<T> converts implicitly to span<T const>.
template <class T>
struct sc::span
{
    // construction
public:
    constexpr span() = default;

    /// Views [ptr, ptr + size). Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        SC_ASSERT(size >= 0, "negative span size");
    }

    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(isize(N)) // NOLINT
    {
    }

    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size()) // NOLINT
    {
    }

    // access
public:
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        SC_ASSERT(0 <= i && i < _size, "span index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T& front() const
    {
        SC_ASSERT(_size > 0, "front() of empty span");
        return _data[0];
    }

    [[nodiscard]] constexpr T& back() const
    {
        SC_ASSERT(_size > 0, "back() of empty span");
        return _data[_size - 1];
    }

    /// nullptr for default-constructed spans and views of zero-capacity containers.
    [[nodiscard]] constexpr T* data() const { return _data; }
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // comparison
public:
    /// Same size and pairwise-equal elements. Where the elements live does not matter.
    [[nodiscard]] friend constexpr bool operator==(span const& lhs, span const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._size != rhs._size)
            return false;
        for (isize i = 0; i < lhs._size; ++i)
            if (!(lhs._data[i] == rhs._data[i]))
                return false;
        return true;
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
