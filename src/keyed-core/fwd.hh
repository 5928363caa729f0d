#pragma once

#include <cstddef>
#include <cstdint>


namespace kc
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
// Sizes, positions and capacities are signed throughout keyed-core:
// * "size - 1" and "index - offset" never wrap around
// * -1 is the "not found" position returned by ordered_map::index_of
// * a negative capacity or position is a detectable caller error instead of a huge unsigned value
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

//
// Container
//

template <class T, class U>
struct pair;

template <class T>
struct vector;

//
// Hashing
//

template <class T>
struct hash;
template <class T>
struct equal_to;

//
// Associative
//

template <class K, class V>
struct map_entry;

template <class MapT>
struct map_keys_view;
template <class MapT>
struct map_values_view;

template <class K, class V, class HashT = hash<K>, class KeyEqualT = equal_to<K>>
struct ordered_map;

//
// Errors
//

struct map_error;
struct duplicate_key_error;
struct key_not_found_error;
struct index_out_of_range_error;
struct invalid_argument_error;

} // namespace kc
