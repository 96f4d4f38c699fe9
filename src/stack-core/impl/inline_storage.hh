#pragma once

#include <stack-core/fwd.hh>

namespace sc::impl
{
/// N uninitialized, correctly aligned slots of T, stored inline.
/// Never constructs, copies or destroys a T: which slots are live is tracked by the owner
/// (sc::stack_vec keeps [0, len) live, sc::stack_vec_into_iter keeps [begin, end) live).
/// Copying the storage itself is disabled; owners relocate live ranges explicitly.
template <class T, isize N>
struct inline_storage
{
    static_assert(N >= 0, "inline_storage capacity must be non-negative");

    inline_storage() = default;
    inline_storage(inline_storage const&) = delete;
    inline_storage& operator=(inline_storage const&) = delete;

    /// Pointer to slot 0 (the start of the contiguous slot array).
    [[nodiscard]] T* ptr() { return reinterpret_cast<T*>(_bytes); }                   // NOLINT
    [[nodiscard]] T const* ptr() const { return reinterpret_cast<T const*>(_bytes); } // NOLINT

    /// Pointer to slot i; does not imply that a live object is there.
    [[nodiscard]] T* slot(isize i) { return ptr() + i; }
    [[nodiscard]] T const* slot(isize i) const { return ptr() + i; }

private:
    alignas(T) byte _bytes[sizeof(T) * N];
};

/// Zero-capacity storage: no bytes, every pointer is nullptr.
template <class T>
struct inline_storage<T, 0>
{
    inline_storage() = default;
    inline_storage(inline_storage const&) = delete;
    inline_storage& operator=(inline_storage const&) = delete;

    [[nodiscard]] T* ptr() { return nullptr; }
    [[nodiscard]] T const* ptr() const { return nullptr; }

    [[nodiscard]] T* slot(isize) { return nullptr; }
    [[nodiscard]] T const* slot(isize) const { return nullptr; }
};
} // namespace sc::impl
