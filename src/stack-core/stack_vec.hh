#pragma once

#include <stack-core/assertf.hh>
#include <stack-core/errors.hh>
#include <stack-core/fwd.hh>
#include <stack-core/impl/inline_storage.hh>
#include <stack-core/impl/object_lifetime_util.hh>
#include <stack-core/optional.hh>
#include <stack-core/result.hh>
#include <stack-core/span.hh>
#include <stack-core/stack_vec_into_iter.hh>
#include <stack-core/utility.hh>

#include <initializer_list>
#include <limits>
#include <type_traits>

/// Growable sequence of T with a compile-time capacity N, stored entirely inline (no heap allocation ever).
/// The object is "inline storage for N elements + a length": slots [0, len) hold live elements in
/// insertion/positional order, slots [len, N) are uninitialized memory.
///
/// Invariants:
///   - 0 <= len() <= N at all times
///   - exactly the elements in [0, len) are live; each is destroyed exactly once
///     (by removal, truncation, clear, conversion into the consuming iterator, or the container's destructor)
///   - elements never move to another memory region during push/pop/insert/remove
///
/// Every operation that could exceed the capacity or address a bad index exists in three tiers:
///   - checked:   try_push / try_insert / try_remove report failure as a value, the container is unchanged
///   - panicking: push / insert / remove report failure through SC_ASSERTF_ALWAYS with a message naming
///                the index, length or capacity involved (always on, also in release builds)
///   - unchecked: push_unchecked / insert_unchecked / remove_unchecked have the precondition as a contract;
///                it is only verified by SC_ASSERT (debug builds)
/// All three tiers share one implementation of the actual mutation.
///
/// Copying copies the live elements (only for copyable T).
/// Moving relocates the live elements and leaves the source empty.
///
/// Usage:
///   sc::stack_vec<int, 4> v;
///   v.push(1);
///   v.push(2);
///   if (v.try_push(3).has_error()) { ... }
///   v.insert(0, 0);            // [0, 1, 2, 3]
///   auto last = v.pop();       // optional holding 3
///   for (auto i : sc::move(v).into_iter()) { ... }
///
/// Throwing move operations of T are not supported by insert/remove (the shifted range is left with
/// moved-from values but remains structurally valid).
template <class T, sc::isize N>
struct sc::stack_vec
{
    static_assert(N >= 0, "stack_vec capacity must be non-negative");
    static_assert(!std::is_reference_v<T>, "stack_vec does not support reference types");
    static_assert(std::is_destructible_v<T>, "T must be destructible");

    using element_type = T;

    /// The compile-time capacity.
    static constexpr isize CAPACITY = N;

    // container properties
public:
    [[nodiscard]] isize len() const { return _len; }
    [[nodiscard]] isize size() const { return _len; }
    [[nodiscard]] bool is_empty() const { return _len == 0; }
    [[nodiscard]] bool empty() const { return _len == 0; }
    [[nodiscard]] bool is_full() const { return _len == N; }

    /// Always N, regardless of the current length.
    [[nodiscard]] static constexpr isize capacity() { return N; }

    /// Number of elements that can still be added.
    [[nodiscard]] isize remaining_capacity() const { return N - _len; }

    // element access
public:
    /// Precondition: 0 <= i < len().
    [[nodiscard]] T& operator[](isize i)
    {
        SC_ASSERT(0 <= i && i < _len, "index out of bounds");
        return *_storage.slot(i);
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        SC_ASSERT(0 <= i && i < _len, "index out of bounds");
        return *_storage.slot(i);
    }

    [[nodiscard]] T& front()
    {
        SC_ASSERT(_len > 0, "front() called on empty stack_vec");
        return *_storage.slot(0);
    }
    [[nodiscard]] T const& front() const
    {
        SC_ASSERT(_len > 0, "front() called on empty stack_vec");
        return *_storage.slot(0);
    }

    [[nodiscard]] T& back()
    {
        SC_ASSERT(_len > 0, "back() called on empty stack_vec");
        return *_storage.slot(_len - 1);
    }
    [[nodiscard]] T const& back() const
    {
        SC_ASSERT(_len > 0, "back() called on empty stack_vec");
        return *_storage.slot(_len - 1);
    }

    /// Pointer to slot 0.
    /// Only [0, len) may be read through it. For N == 0 this is nullptr.
    [[nodiscard]] T* data() { return _storage.ptr(); }
    [[nodiscard]] T const* data() const { return _storage.ptr(); }
    [[nodiscard]] T* as_mut_ptr() { return _storage.ptr(); }
    [[nodiscard]] T const* as_ptr() const { return _storage.ptr(); }

    /// View of exactly the live range [0, len).
    /// Valid until the next mutation of the container.
    [[nodiscard]] sc::span<T> as_span() { return sc::span<T>(_storage.ptr(), _len); }
    [[nodiscard]] sc::span<T const> as_span() const { return sc::span<T const>(_storage.ptr(), _len); }

    // iterators
public:
    [[nodiscard]] T* begin() { return _storage.ptr(); }
    [[nodiscard]] T* end() { return _storage.slot(_len); }
    [[nodiscard]] T const* begin() const { return _storage.ptr(); }
    [[nodiscard]] T const* end() const { return _storage.slot(_len); }

    // append
public:
    /// Constructs a new element at position len() in place and returns a reference to it.
    /// Calls SC_ASSERTF_ALWAYS if the container is full.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        SC_ASSERTF_ALWAYS(_len < N, "push failed: not enough space in stack_vec (capacity is {})", N);
        return emplace_unchecked(sc::forward<Args>(args)...);
    }

    /// Precondition: len() < N (only verified by SC_ASSERT).
    template <class... Args>
    T& emplace_unchecked(Args&&... args)
    {
        SC_ASSERT(_len < N, "emplace_unchecked: stack_vec is full");
        auto const p = new (sc::placement_new, _storage.slot(_len)) T(sc::forward<Args>(args)...);
        ++_len; // only after construction succeeded
        return *p;
    }

    /// Appends value at position len(); calls SC_ASSERTF_ALWAYS if the container is full.
    T& push(T const& value) { return emplace(value); }
    T& push(T&& value) { return emplace(sc::move(value)); }

    /// Appends value at position len().
    /// Returns not_enough_space and leaves the container (and value) untouched if it is full.
    sc::result<void, not_enough_space> try_push(T const& value)
    {
        if (_len == N)
            return sc::error(not_enough_space{});
        emplace_unchecked(value);
        return {};
    }
    sc::result<void, not_enough_space> try_push(T&& value)
    {
        if (_len == N)
            return sc::error(not_enough_space{});
        emplace_unchecked(sc::move(value));
        return {};
    }

    /// Precondition: len() < N (only verified by SC_ASSERT).
    T& push_unchecked(T const& value) { return emplace_unchecked(value); }
    T& push_unchecked(T&& value) { return emplace_unchecked(sc::move(value)); }

    /// Appends every element of range, in range order.
    /// Elements are moved out of rvalue ranges and copied from lvalue ranges.
    /// Calls SC_ASSERTF_ALWAYS as soon as the next element does not fit; everything appended before stays.
    template <class Range>
    void extend(Range&& range)
    {
        for (auto&& v : range)
        {
            if constexpr (std::is_rvalue_reference_v<Range&&>)
                emplace(sc::move(v));
            else
                emplace(sc::forward<decltype(v)>(v));
        }
    }
    void extend(std::initializer_list<T> values)
    {
        for (auto const& v : values)
            emplace(v);
    }

    /// Appends count copies of value.
    /// Calls SC_ASSERTF_ALWAYS (before adding anything) if len() + count exceeds N.
    void extend_with(isize count, T const& value)
    {
        SC_ASSERT(count >= 0, "count must be non-negative");
        // required length saturates at the isize maximum
        SC_ASSERTF_ALWAYS(count <= N - _len, "extend failed: capacity too low (is {}, required {})", N,
                          count > std::numeric_limits<isize>::max() - _len ? std::numeric_limits<isize>::max() : _len + count);
        for (isize i = 0; i < count; ++i)
            emplace_unchecked(value);
    }

    // insertion
public:
    /// Inserts value at position idx, shifting [idx, len) one slot toward the back.
    /// idx == len() appends.
    /// Calls SC_ASSERTF_ALWAYS if idx is outside [0, len()] or the container is full (index is checked first).
    /// O(len - idx).
    void insert(isize idx, T value)
    {
        SC_ASSERTF_ALWAYS(0 <= idx && idx <= _len, "insertion index (is {}) should be <= len (is {})", idx, _len);
        SC_ASSERTF_ALWAYS(_len < N, "insertion failed: not enough space in stack_vec (capacity is {})", N);
        insert_unchecked(idx, sc::move(value));
    }

    /// Inserts value at position idx.
    /// On failure the container is unchanged and the error is
    ///   insert_error::index_out_of_range   if idx is outside [0, len()] (reported even if the container is also full)
    ///   insert_error::not_enough_space     if len() == N
    sc::result<void, insert_error> try_insert(isize idx, T value)
    {
        if (idx < 0 || idx > _len)
            return sc::error(insert_error::index_out_of_range);
        if (_len == N)
            return sc::error(insert_error::not_enough_space);
        insert_unchecked(idx, sc::move(value));
        return {};
    }

    /// Precondition: 0 <= idx <= len() < N (only verified by SC_ASSERT).
    void insert_unchecked(isize idx, T value)
    {
        SC_ASSERT(0 <= idx && idx <= _len, "insertion index out of bounds");
        SC_ASSERT(_len < N, "insert_unchecked: stack_vec is full");

        auto const p_obj = _storage.slot(idx);
        auto const p_end = _storage.slot(_len);
        if (p_obj == p_end)
        {
            new (sc::placement_new, p_end) T(sc::move(value));
        }
        else
        {
            impl::shift_objects_back_by_one(p_obj, p_end);
            *p_obj = sc::move(value);
        }
        ++_len;
    }

    // removal
public:
    /// Moves the last element out, or returns nullopt if the container is empty.
    /// O(1).
    [[nodiscard]] sc::optional<T> pop()
    {
        if (_len == 0)
            return sc::nullopt;

        auto const p = _storage.slot(_len - 1);
        sc::optional<T> value(sc::move(*p));
        p->~T();
        --_len;
        return value;
    }

    /// Removes and returns the element at idx, shifting [idx + 1, len) one slot toward the front.
    /// Calls SC_ASSERTF_ALWAYS if idx is outside [0, len()).
    /// O(len - idx).
    T remove(isize idx)
    {
        SC_ASSERTF_ALWAYS(0 <= idx && idx < _len, "removal index (is {}) should be < len (is {})", idx, _len);
        return remove_unchecked(idx);
    }

    /// Removes and returns the element at idx, or returns nullopt (container unchanged) if idx is outside [0, len()).
    [[nodiscard]] sc::optional<T> try_remove(isize idx)
    {
        if (idx < 0 || idx >= _len)
            return sc::nullopt;
        return sc::optional<T>(remove_unchecked(idx));
    }

    /// Precondition: 0 <= idx < len() (only verified by SC_ASSERT).
    T remove_unchecked(isize idx)
    {
        SC_ASSERT(0 <= idx && idx < _len, "removal index out of bounds");

        auto const p_obj = _storage.slot(idx);
        auto const p_end = _storage.slot(_len);

        T value = sc::move(*p_obj);
        impl::compact_move_objects_backward(p_obj, p_obj + 1, p_end);
        (p_end - 1)->~T();
        --_len;
        return value;
    }

    /// Destroys all elements in index order; len() becomes 0.
    void clear()
    {
        impl::destroy_objects(_storage.ptr(), _storage.slot(_len));
        _len = 0;
    }

    /// Destroys the elements [new_len, len) in index order.
    /// No-op if new_len >= len(). Negative new_len is treated as 0.
    void truncate(isize new_len)
    {
        new_len = sc::max(new_len, isize(0));
        if (new_len >= _len)
            return;
        impl::destroy_objects(_storage.slot(new_len), _storage.slot(_len));
        _len = new_len;
    }

    /// Truncates to new_len, or appends copies of value until len() == new_len.
    /// Calls SC_ASSERTF_ALWAYS (before adding anything) if new_len exceeds N.
    void resize(isize new_len, T const& value)
    {
        if (new_len > _len)
            extend_with(new_len - _len, value);
        else
            truncate(new_len);
    }

    /// Sets the length without constructing or destroying anything.
    /// The caller is responsible for [0, new_len) being live afterwards and for destroying any
    /// elements that fall outside the new range.
    /// Precondition: 0 <= new_len <= N (only verified by SC_ASSERT).
    void set_len(isize new_len)
    {
        SC_ASSERT(0 <= new_len && new_len <= N, "set_len: new length exceeds capacity");
        _len = new_len;
    }

    // conversion
public:
    /// Moves all elements into a consuming iterator; this container is left empty.
    /// Usage:
    ///   auto it = sc::move(vec).into_iter();
    ///   while (auto v = it.next()) { ... }
    [[nodiscard]] stack_vec_into_iter<T, N> into_iter() &&
    {
        auto const count = sc::exchange(_len, isize(0));
        return stack_vec_into_iter<T, N>(_storage.ptr(), count);
    }

    // creation
public:
    /// An empty container.
    [[nodiscard]] static stack_vec create_empty() { return stack_vec(); }

    /// Moves the elements of values into a new container, in order.
    /// Returns nullopt if M > N.
    /// Usage:
    ///   auto v = sc::stack_vec<int, 4>::from_array({1, 2, 3});
    template <isize M>
    [[nodiscard]] static sc::optional<stack_vec> from_array(T (&&values)[M])
    {
        if constexpr (M > N)
            return sc::nullopt;

        stack_vec v;
        for (auto& value : values)
            v.emplace_unchecked(sc::move(value));
        return sc::optional<stack_vec>(sc::move(v));
    }

    /// Copies the elements of values into a new container, in order.
    /// Returns nullopt if values.size() > N. Also accepts an empty list.
    [[nodiscard]] static sc::optional<stack_vec> from_array(sc::span<T const> values)
        requires std::is_copy_constructible_v<T>
    {
        if (values.size() > N)
            return sc::nullopt;

        stack_vec v;
        for (auto const& value : values)
            v.emplace_unchecked(value);
        return sc::optional<stack_vec>(sc::move(v));
    }

    /// A container holding exactly the N given elements. Cannot fail.
    template <isize M>
        requires(M == N)
    [[nodiscard]] static stack_vec from_full_array(T (&&values)[M])
    {
        stack_vec v;
        for (auto& value : values)
            v.emplace_unchecked(sc::move(value));
        return v;
    }

    /// A container holding count copies of value.
    /// Returns nullopt if count > N. Precondition: count >= 0.
    [[nodiscard]] static sc::optional<stack_vec> from_value(T const& value, isize count)
    {
        SC_ASSERT(count >= 0, "count must be non-negative");
        if (count > N)
            return sc::nullopt;

        stack_vec v;
        for (isize i = 0; i < count; ++i)
            v.emplace_unchecked(value);
        return sc::optional<stack_vec>(sc::move(v));
    }

    stack_vec() = default;

    stack_vec(stack_vec const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        for (auto const& v : rhs)
            emplace_unchecked(v);
    }

    /// Relocates the live elements of rhs; rhs is left empty.
    stack_vec(stack_vec&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        auto p_end = _storage.ptr();
        impl::relocate_objects_to(p_end, rhs._storage.ptr(), rhs._storage.slot(rhs._len));
        _len = sc::exchange(rhs._len, isize(0));
    }

    stack_vec& operator=(stack_vec const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            clear();
            for (auto const& v : rhs)
                emplace_unchecked(v);
        }
        return *this;
    }

    stack_vec& operator=(stack_vec&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            clear();
            auto p_end = _storage.ptr();
            impl::relocate_objects_to(p_end, rhs._storage.ptr(), rhs._storage.slot(rhs._len));
            _len = sc::exchange(rhs._len, isize(0));
        }
        return *this;
    }

    ~stack_vec() { impl::destroy_objects(_storage.ptr(), _storage.slot(_len)); }

    // members
private:
    impl::inline_storage<T, N> _storage;
    isize _len = 0;
};

namespace sc
{
/// Element-wise equality between containers of any two capacities.
/// Capacity never participates: equal lengths and pairwise-equal elements.
template <class T, isize N, isize M>
[[nodiscard]] bool operator==(stack_vec<T, N> const& lhs, stack_vec<T, M> const& rhs)
    requires requires(T const& v) { bool(v == v); }
{
    return lhs.as_span() == rhs.as_span();
}

/// Element-wise equality with any contiguous view of T.
template <class T, isize N>
[[nodiscard]] bool operator==(stack_vec<T, N> const& lhs, std::type_identity_t<span<T const>> rhs)
    requires requires(T const& v) { bool(v == v); }
{
    return lhs.as_span() == rhs;
}
} // namespace sc
