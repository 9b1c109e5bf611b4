#pragma once

#include <cstddef>
#include <cstdint>


namespace bc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout.
// Plain "int" is fine for loop counters and other small counts.

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
// Sizes, indices and capacities are all signed:
// * "size - 1" and "idx - offset" cannot silently wrap around
// * a negative index is a detectable contract violation instead of a huge positive one
// * mixed signed/unsigned comparisons disappear from the bounds checks
// We only target 64-bit platforms, so the range is never the limiting factor.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct storage_block;

//
// Buffer
//

template <class T>
struct buffer;
template <class T>
struct buffer_view;
template <class T>
struct buffer_cursor;

} // namespace bc
