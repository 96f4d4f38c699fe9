#pragma once

#include <stack-core/assert.hh>
#include <stack-core/fwd.hh>
#include <stack-core/optional.hh>
#include <stack-core/utility.hh>

#include <type_traits>

namespace sc
{
/// Wrapper marking a value as the error alternative of a result.
/// Created via sc::error(e); implicitly converts into any result<T, E> with matching E.
template <class E>
struct error_value
{
    E value;
};

/// Usage:
///   return sc::error(sc::insert_error::index_out_of_range);
template <class E>
[[nodiscard]] constexpr error_value<std::remove_cvref_t<E>> error(E&& e)
{
    return {sc::forward<E>(e)};
}
} // namespace sc

/// Sum type representing either a success value T or an error value E.
/// Used for operations that can fail with an expected, recoverable error (e.g. sc::stack_vec::try_push).
/// Like sc::optional, there is no operator* or operator->: use value() and error().
/// Discarding a result is a warning; a checked call whose outcome is ignored should be the unchecked or
/// panicking variant instead.
template <class T, class E>
struct [[nodiscard]] sc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    // construction
public:
    /// Success: holds a value constructed from value.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && std::is_constructible_v<T, U &&>)
    constexpr result(U&& value) : _has_value(true) // NOLINT
    {
        new (sc::placement_new, &_value) T(sc::forward<U>(value));
    }

    /// Failure: holds the wrapped error.
    constexpr result(error_value<E> err) : _has_value(false) // NOLINT
    {
        new (sc::placement_new, &_error) E(sc::move(err.value));
    }

    result(result&& rhs) noexcept : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (sc::placement_new, &_value) T(sc::move(rhs._value));
        else
            new (sc::placement_new, &_error) E(sc::move(rhs._error));
    }

    result(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (sc::placement_new, &_value) T(rhs._value);
        else
            new (sc::placement_new, &_error) E(rhs._error);
    }

    // results are produced and inspected, not reassigned
    result& operator=(result&&) = delete;
    result& operator=(result const&) = delete;

    ~result()
    {
        if (_has_value)
            _value.~T();
        else
            _error.~E();
    }

    // queries and access
public:
    /// Returns true if this result holds a success value.
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    /// Returns true if this result holds an error.
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Returns the success value, preserving the value category of the result.
    /// Precondition: has_value().
    template <class Self>
    [[nodiscard]] constexpr auto&& value(this Self&& self)
    {
        SC_ASSERT(self.has_value(), "attempted to access value of a failed result");
        return static_cast<Self&&>(self)._value;
    }

    /// Returns the error, preserving the value category of the result.
    /// Precondition: has_error().
    template <class Self>
    [[nodiscard]] constexpr auto&& error(this Self&& self)
    {
        SC_ASSERT(self.has_error(), "attempted to access error of a successful result");
        return static_cast<Self&&>(self)._error;
    }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return lhs._has_value ? lhs._value == rhs._value : lhs._error == rhs._error;
    }

    /// True iff this result holds an error equal to rhs.value.
    [[nodiscard]] friend constexpr bool operator==(result const& lhs, error_value<E> const& rhs)
        requires requires(E const& e) { bool(e == e); }
    {
        return !lhs._has_value && lhs._error == rhs.value;
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};

/// Result of an operation that produces nothing on success.
/// Default-constructed result<void, E> is the success state.
template <class E>
struct [[nodiscard]] sc::result<void, E>
{
    // construction
public:
    /// Success.
    constexpr result() = default;

    /// Failure: holds the wrapped error.
    constexpr result(error_value<E> err) : _error(sc::move(err.value)) {} // NOLINT

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return !_error.has_value(); }
    [[nodiscard]] constexpr bool has_error() const { return _error.has_value(); }

    /// Returns the error, preserving the value category of the result.
    /// Precondition: has_error().
    template <class Self>
    [[nodiscard]] constexpr auto&& error(this Self&& self)
    {
        SC_ASSERT(self.has_error(), "attempted to access error of a successful result");
        return static_cast<Self&&>(self)._error.value();
    }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
        requires requires(E const& e) { bool(e == e); }
    {
        return lhs._error == rhs._error;
    }

    [[nodiscard]] friend constexpr bool operator==(result const& lhs, error_value<E> const& rhs)
        requires requires(E const& e) { bool(e == e); }
    {
        return lhs._error == rhs.value;
    }

    // members
private:
    sc::optional<E> _error;
};
