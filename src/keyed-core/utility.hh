#pragma once

#include <keyed-core/assert.hh>
#include <keyed-core/fwd.hh>

#include <cstring>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Powers of two:
//   is_power_of_two(value)      - check if value is a power of 2
//   next_power_of_two(value)    - smallest power of 2 that is >= value
//
// Object construction:
//   new (kc::placement_new, ptr) T(...)  - placement new without including <new>
//   kc::memcpy(dest, src, bytes)         - raw byte copy for trivially copyable ranges
//

namespace kc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   entries.push_back(kc::move(entry));
template <class T>
[[nodiscard]] KC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] KC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] KC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto old_data = kc::exchange(_data, nullptr); // take ownership, leave empty
template <class T, class U = T>
[[nodiscard]] KC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Powers of two
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    KC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Smallest power of two that is >= value
/// Usage:
///   kc::next_power_of_two(isize(100)); // 128
///   kc::next_power_of_two(isize(128)); // 128
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr T next_power_of_two(T value)
{
    KC_ASSERT(value > 0, "next_power_of_two: value must be positive");
    T result = 1;
    while (result < value)
        result <<= 1;
    return result;
}

// =========================================================================================================
// Object construction
// =========================================================================================================

struct placement_new_t
{
};

/// Tag for placement new that does not depend on <new>
/// Usage:
///   new (kc::placement_new, ptr) T(args...);
inline constexpr placement_new_t placement_new{};

/// Byte-wise copy of non-overlapping ranges
/// Only used for trivially copyable element types
KC_FORCE_INLINE void memcpy(void* dest, void const* src, isize bytes)
{
    std::memcpy(dest, src, std::size_t(bytes));
}

/// Byte-wise copy of possibly overlapping ranges
KC_FORCE_INLINE void memmove(void* dest, void const* src, isize bytes)
{
    std::memmove(dest, src, std::size_t(bytes));
}

} // namespace kc

[[nodiscard]] inline void* operator new(std::size_t, kc::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, kc::placement_new_t, void*) noexcept {}
