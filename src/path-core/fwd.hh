#pragma once

#include <cstddef>
#include <cstdint>


namespace pc
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
// Sizes and indices are signed so that "size - 1" and "not found" (-1) need no special casing.
// Byte strings are indexed with isize throughout, including search results.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;
struct string_memory_stats;

//
// Views
//

template <class T>
struct span;
struct string_view;

//
// Strings and paths
//

enum class tri_state : u8;
enum class metadata : u8;
struct scan_result;
struct byte_string;
struct game_path;

} // namespace pc
