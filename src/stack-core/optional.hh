#pragma once

#include <stack-core/assert.hh>
#include <stack-core/fwd.hh>
#include <stack-core/utility.hh>

#include <type_traits>

/// Tag for the empty state of sc::optional.
/// Only constructible through sc::nullopt.
struct sc::nullopt_t
{
    struct tag_t
    {
    };
    explicit constexpr nullopt_t(tag_t) {}
};

namespace sc
{
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::tag_t{}};
} // namespace sc

/// Either a T or nothing.
/// This is how stack-core hands out elements that may not exist:
///   - stack_vec::pop() and try_remove(idx)
///   - stack_vec_into_iter::next() and next_back()
///   - stack_vec::from_array(...) and from_value(...) when the elements do not fit
///
/// There is no operator* or operator->. The value is accessed through value(), which checks
/// has_value() via SC_ASSERT and keeps the value category of the optional:
///   auto last = vec.pop();
///   if (last.has_value())
///       use(sc::move(last).value());
///
/// Moving out of an engaged optional leaves it engaged with a moved-from T.
/// optional<T> is trivially copyable and destructible whenever T is.
template <class T>
struct sc::optional
{
    static_assert(!std::is_reference_v<T>, "optional does not support references");

    // construction
public:
    optional() = default;
    constexpr optional(nullopt_t) {} // NOLINT

    /// Holds a T constructed from value.
    /// Implicit when U converts implicitly to T, so `return value;` works for functions returning optional<T>.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) // NOLINT
    {
        emplace_unchecked(sc::forward<U>(value));
    }

    // special members for trivially copyable T
public:
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // special members for everything else
public:
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            emplace_unchecked(rhs._storage.value);
    }

    optional(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
            emplace_unchecked(sc::move(rhs._storage.value));
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._has_value)
                emplace_unchecked(rhs._storage.value);
        }
        return *this;
    }

    optional& operator=(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._has_value)
                emplace_unchecked(sc::move(rhs._storage.value));
        }
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // modification
public:
    /// Destroys the held value, if any.
    void reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Precondition: has_value().
    template <class Self>
    [[nodiscard]] constexpr auto&& value(this Self&& self)
    {
        SC_ASSERT(self._has_value, "value() called on empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// The held value, or fallback if empty.
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(sc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) &&
    {
        return _has_value ? sc::move(_storage.value) : static_cast<T>(sc::forward<U>(fallback));
    }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return !lhs._has_value || lhs._storage.value == rhs._storage.value;
    }

    /// False if lhs is empty.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    // optional<int> == true would silently compare against 1
    bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

private:
    template <class... Args>
    constexpr void emplace_unchecked(Args&&... args)
    {
        new (sc::placement_new, &_storage.value) T(sc::forward<Args>(args)...);
        _has_value = true;
    }

    // members
private:
    sc::storage_for<T> _storage;
    bool _has_value = false;
};
