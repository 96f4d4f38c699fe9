#pragma once

#include <cstddef>
#include <cstdint>


namespace sc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout,
// and plain "int" for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, lengths, capacities and indices are signed i64 throughout stack-core:
// * "len - 1" on an empty container is -1, not a huge positive number
// * a negative index is simply out of range and is reported like any other bad index
// * no mixed signed/unsigned comparisons between indices and lengths
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

//
// Sum types
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class E>
struct result;

//
// Errors
//

struct not_enough_space;
enum class insert_error;

//
// Container
//

template <class T, isize N>
struct stack_vec;

template <class T, isize N>
struct stack_vec_into_iter;

} // namespace sc
