#pragma once

#include <cstddef>
#include <cstdint>


namespace mm
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

// generic bytes
using byte = std::byte;

// signed size type
// All sizes, capacities and indices are signed:
// "size - 1" on an empty container is -1 and trips a bounds assertion instead of wrapping around.
// Capacities are tiny in this library, so the range of i64 is never a concern.
using isize = i64;

//
// Views
//

template <class T>
struct strided_iterator;
template <class T>
struct strided_span;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, isize N>
struct fixed_vector;

template <class K, class V, isize N>
struct fixed_map;

} // namespace mm
