#pragma once

#include <cstddef>
#include <cstdint>


namespace ax
{

//
// Primitives
//

// Explicitly-sized primitive types
// Element types of the typed modules (bytes, integers, doubles) are spelled with these.
// Plain "int" is fine for small local counts where the range does not matter.

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

// floating point
using f32 = float;
using f64 = double;

// signed size type
// All sizes, counts, indices and offsets in arrayx are isize.
// Index-returning queries use -1 as the "not found" sentinel, which only works with a signed type.
// Rotation amounts and slice bounds are validated as signed values before any arithmetic,
// so "start - 1" or "size - k" never wraps around.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

//
// Callables
//

template <class Signature>
struct function_ref;

//
// Errors
//

enum class error_kind;
struct error;

//
// Domain types
//

struct guid;
template <class T>
struct matrix;

} // namespace ax
