#pragma once

#include <keyed-core/fwd.hh>

#include <concepts>
#include <cstdint>
#include <functional> // std::hash fallback
#include <type_traits>

// =========================================================================================================
// Hashing
// =========================================================================================================
//
// kc::hash<T> and kc::equal_to<T> are the default key strategy of kc::ordered_map.
//
// kc::hash<T> always produces a well-mixed u64, so the map can take the low bits as slot index:
//   - integers, enums, pointers:  64-bit finalizer over the value
//   - types with a member `u64 hash() const`: that hash, finalized
//   - everything else:            std::hash<T>, finalized
//
// Custom strategies are plain callables `u64(K const&)`; they must hash keys that compare equal
// under the map's key equality to the same value.
//
// Usage:
//   kc::u64 h = kc::hash<int>{}(42);
//   h = kc::hash_combine(h, kc::hash<std::string>{}(name));
//

namespace kc
{
/// 64-bit finalizer (splitmix64): spreads every input bit over the whole output
[[nodiscard]] constexpr u64 hash_mix(u64 value) noexcept
{
    value ^= value >> 30;
    value *= 0xbf58476d1ce4e5b9ull;
    value ^= value >> 27;
    value *= 0x94d049bb133111ebull;
    value ^= value >> 31;
    return value;
}

/// Combines two hashes into one; order-dependent (hash_combine(a, b) != hash_combine(b, a) in general)
[[nodiscard]] constexpr u64 hash_combine(u64 seed, u64 h) noexcept
{
    return hash_mix(seed ^ (h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2)));
}
} // namespace kc

template <class T>
struct kc::hash
{
    [[nodiscard]] constexpr u64 operator()(T const& value) const
    {
        if constexpr (std::is_integral_v<T> || std::is_enum_v<T>)
        {
            return kc::hash_mix(u64(value));
        }
        else if constexpr (std::is_pointer_v<T>)
        {
            return kc::hash_mix(u64(reinterpret_cast<std::uintptr_t>(value)));
        }
        else if constexpr (requires { { value.hash() } -> std::convertible_to<u64>; })
        {
            return kc::hash_mix(u64(value.hash()));
        }
        else
        {
            static_assert(requires { std::hash<T>{}(value); },
                          "no kc::hash for T: add a member `u64 hash() const`, specialize std::hash<T>, "
                          "or pass a custom hash to the container");
            return kc::hash_mix(u64(std::hash<T>{}(value)));
        }
    }
};

/// Default key equality: operator==
template <class T>
struct kc::equal_to
{
    [[nodiscard]] constexpr bool operator()(T const& a, T const& b) const { return a == b; }
};
