#pragma once

#include <keyed-core/fwd.hh>
#include <keyed-core/impl/object_lifetime_util.hh>
#include <keyed-core/pair.hh>
#include <keyed-core/utility.hh>

#include <cstddef>
#include <type_traits>
#include <utility> // for tuple_size

/// One stored (key, value) element of kc::ordered_map, together with the cached hash of its key.
///
/// The key is immutable once stored: it is only reachable as `K const&`.
/// The value is freely mutable in place.
/// Supports structured bindings, where the key binds as const:
///
///   for (auto& [key, value] : map)
///       value += 1; // key is K const&
///
/// The cached hash lets the map rebuild and probe its index without rehashing keys.
///
/// Entries are copy and move constructible but not assignable from outside:
/// overwriting an entry handed out by the map (get_at, begin, std::swap, std::sort) would change
/// a key behind the map's index. Only kc::vector relocates entries by assignment.
template <class K, class V>
struct kc::map_entry
{
    using key_t = K;
    using value_t = V;

    template <class KeyT, class... Args>
    map_entry(u64 key_hash, KeyT&& key, Args&&... value_args)
      : _key(kc::forward<KeyT>(key)), _value(kc::forward<Args>(value_args)...), _key_hash(key_hash)
    {
    }

    map_entry(map_entry const&) = default;
    map_entry(map_entry&&) = default;

    // access
public:
    [[nodiscard]] K const& key() const { return _key; }

    [[nodiscard]] V& value() { return _value; }
    [[nodiscard]] V const& value() const { return _value; }

    /// Hash of key() under the owning map's hash function.
    [[nodiscard]] u64 key_hash() const { return _key_hash; }

    /// Copy of key and value as a plain pair.
    [[nodiscard]] kc::pair<K, V> to_pair() const { return {_key, _value}; }

    // comparison
public:
    /// Entries compare by key and value; the cached hash is derived state and ignored.
    [[nodiscard]] friend bool operator==(map_entry const& lhs, map_entry const& rhs)
        requires requires(K const& k, V const& v) {
            bool(k == k);
            bool(v == v);
        }
    {
        return lhs._key == rhs._key && lhs._value == rhs._value;
    }

    [[nodiscard]] friend bool operator==(map_entry const& lhs, kc::pair<K, V> const& rhs)
        requires requires(K const& k, V const& v) {
            bool(k == k);
            bool(v == v);
        }
    {
        return lhs._key == rhs.first && lhs._value == rhs.second;
    }

    // tuple protocol
public:
    template <std::size_t I, class E>
    [[nodiscard]] friend constexpr decltype(auto) get(E&& e) noexcept
        requires(std::is_same_v<std::remove_cvref_t<E>, map_entry> && I < 2)
    {
        if constexpr (I == 0)
            return static_cast<K const&>(e._key);
        else
            return (kc::forward<E>(e)._value);
    }

private:
    map_entry& operator=(map_entry const&) = default;
    map_entry& operator=(map_entry&&) = default;

    template <class T>
    friend struct kc::vector;
    template <class T>
    friend constexpr void impl::compact_move_objects_backward(T* dest, T* src_start, T* src_end);
    template <class T>
    friend constexpr void impl::shift_move_objects_forward(T* pos, T*& obj_end);

    K _key;
    V _value;
    u64 _key_hash;
};

namespace std
{
template <class K, class V>
struct tuple_size<kc::map_entry<K, V>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class K, class V>
struct tuple_element<I, kc::map_entry<K, V>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, K const, V>;
};
} // namespace std
