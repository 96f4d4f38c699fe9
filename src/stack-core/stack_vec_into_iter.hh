#pragma once

#include <stack-core/assert.hh>
#include <stack-core/fwd.hh>
#include <stack-core/impl/inline_storage.hh>
#include <stack-core/impl/object_lifetime_util.hh>
#include <stack-core/optional.hh>
#include <stack-core/span.hh>
#include <stack-core/utility.hh>

#include <type_traits>

/// Consuming, double-ended iterator over the elements of a sc::stack_vec<T, N>.
/// Created by `sc::move(vec).into_iter()`.
///
/// Ownership:
///   The live range of the container is relocated into the iterator's own inline storage when the
///   iterator is created, and the container is left empty. From then on the iterator is the only owner
///   of the elements it has not yielded yet, i.e. of the slots [begin, end).
///   next() and next_back() move exactly one element out of the range and end its lifetime in the slot.
///   The destructor destroys every element still in [begin, end), so an iterator that is dropped
///   before exhaustion (e.g. after taking the first few elements) does not leak.
///
/// len() is the element count end - begin; it never depends on sizeof(T).
///
/// Range-based for:
///   for (auto v : sc::move(vec).into_iter()) { ... }
///   yields each element by move, front to back. *it returns T&& to the front element and ++it ends its
///   lifetime, so breaking out of the loop leaves the current element (possibly moved-from) in the iterator.
template <class T, sc::isize N>
struct sc::stack_vec_into_iter
{
    // input iterator used by range-based for
public:
    struct cursor
    {
        [[nodiscard]] T&& operator*() const
        {
            SC_ASSERT(!_owner->is_empty(), "dereferencing exhausted stack_vec_into_iter");
            return sc::move(*_owner->_storage.slot(_owner->_begin));
        }

        cursor& operator++()
        {
            SC_ASSERT(!_owner->is_empty(), "incrementing exhausted stack_vec_into_iter");
            _owner->_storage.slot(_owner->_begin)->~T();
            ++_owner->_begin;
            return *this;
        }

        [[nodiscard]] bool operator!=(sc::sentinel) const { return !_owner->is_empty(); }
        [[nodiscard]] bool operator==(sc::sentinel) const { return _owner->is_empty(); }

        stack_vec_into_iter* _owner;
    };

    [[nodiscard]] cursor begin() { return cursor{this}; }
    [[nodiscard]] sc::sentinel end() const { return {}; }

    // iteration
public:
    /// Moves the front element out, or returns nullopt if the iterator is exhausted.
    /// O(1).
    [[nodiscard]] sc::optional<T> next()
    {
        if (_begin == _end)
            return sc::nullopt;

        auto const p = _storage.slot(_begin);
        sc::optional<T> value(sc::move(*p));
        p->~T();
        ++_begin;
        return value;
    }

    /// Moves the back element out, or returns nullopt if the iterator is exhausted.
    /// O(1). May be mixed freely with next(); the two cursors never cross.
    [[nodiscard]] sc::optional<T> next_back()
    {
        if (_begin == _end)
            return sc::nullopt;

        --_end;
        auto const p = _storage.slot(_end);
        sc::optional<T> value(sc::move(*p));
        p->~T();
        return value;
    }

    // queries
public:
    /// Number of elements not yet yielded.
    [[nodiscard]] isize len() const { return _end - _begin; }
    [[nodiscard]] isize size() const { return _end - _begin; }
    [[nodiscard]] bool is_empty() const { return _begin == _end; }

    /// Read-only view of the elements not yet yielded, front to back.
    [[nodiscard]] sc::span<T const> as_span() const { return sc::span<T const>(_storage.slot(_begin), _end - _begin); }

    // construction
public:
    /// An exhausted iterator.
    stack_vec_into_iter() = default;

    /// Takes over the remaining elements of rhs, which is left exhausted.
    stack_vec_into_iter(stack_vec_into_iter&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        impl_take_remaining_of(rhs);
    }
    stack_vec_into_iter& operator=(stack_vec_into_iter&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            impl::destroy_objects(_storage.slot(_begin), _storage.slot(_end));
            impl_take_remaining_of(rhs);
        }
        return *this;
    }

    // elements are owned exactly once
    stack_vec_into_iter(stack_vec_into_iter const&) = delete;
    stack_vec_into_iter& operator=(stack_vec_into_iter const&) = delete;

    /// Destroys every element that was not yielded.
    ~stack_vec_into_iter() { impl::destroy_objects(_storage.slot(_begin), _storage.slot(_end)); }

private:
    /// Relocates the live objects [src, src + count) into this iterator.
    /// Afterwards [src, src + count) is uninitialized memory; the caller must not touch it again.
    stack_vec_into_iter(T* src, isize count)
    {
        SC_ASSERT(0 <= count && count <= N, "relocated range exceeds capacity");
        auto p_end = _storage.ptr();
        impl::relocate_objects_to(p_end, src, src + count);
        _end = count;
    }

    void impl_take_remaining_of(stack_vec_into_iter& rhs)
    {
        auto p_end = _storage.ptr();
        impl::relocate_objects_to(p_end, rhs._storage.slot(rhs._begin), rhs._storage.slot(rhs._end));
        _begin = 0;
        _end = rhs._end - rhs._begin;
        rhs._begin = 0;
        rhs._end = 0;
    }

    friend struct sc::stack_vec<T, N>;

    // members
private:
    impl::inline_storage<T, N> _storage;
    isize _begin = 0;
    isize _end = 0;
};
