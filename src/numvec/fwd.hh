#pragma once

#include <cstddef>
#include <cstdint>


namespace nv
{

//
// Primitives
//

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
// All lengths, indices, exponents and shape extents are isize.
// "size - 1" on an empty vector stays a small negative number instead of wrapping around,
// and negative lengths or indices can be rejected by a plain "< 0" check.
using isize = i64;

//
// Views
//

template <class T>
struct span;

struct index_range;

//
// Container
//

template <class T>
struct vector;

} // namespace nv
