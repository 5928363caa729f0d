#pragma once

#include <keyed-core/fwd.hh>

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility> // std::declval

// =========================================================================================================
// Live key / value views of kc::ordered_map
// =========================================================================================================
//
// A view holds a pointer to its map, never to the map's storage.
// Every access reads through the map, so a view reflects all later mutations
// (adds, removals, positional inserts, value updates) without being re-acquired.
// Iterators of a view are invalidated like the map's own iterators.
//
// MapT is `ordered_map<...>` for mutable access or `ordered_map<...> const` for read-only access.
// Keys are always read-only; values are mutable through a view of a mutable map.
//
// Usage:
//   auto keys = m.keys();
//   m.add(3, 'c');
//   CHECK(keys.size() == m.size()); // still in sync
//
//   for (auto& v : m.values())
//       v = 'x';
//

namespace kc::impl
{
/// Forward iterator over the entries of a map, projecting each entry through ProjectT
template <class EntryPtrT, class ProjectT>
struct map_projection_iterator
{
    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using reference = decltype(ProjectT{}(*std::declval<EntryPtrT>()));
    using value_type = std::remove_cvref_t<reference>;

    map_projection_iterator() = default;
    explicit map_projection_iterator(EntryPtrT entry) : _entry(entry) {}

    [[nodiscard]] reference operator*() const { return ProjectT{}(*_entry); }

    map_projection_iterator& operator++()
    {
        ++_entry;
        return *this;
    }
    map_projection_iterator operator++(int)
    {
        auto const prev = *this;
        ++_entry;
        return prev;
    }

    [[nodiscard]] bool operator==(map_projection_iterator const& rhs) const = default;

private:
    EntryPtrT _entry = nullptr;
};

struct project_key
{
    template <class EntryT>
    [[nodiscard]] decltype(auto) operator()(EntryT& e) const
    {
        return e.key();
    }
};

struct project_value
{
    template <class EntryT>
    [[nodiscard]] decltype(auto) operator()(EntryT& e) const
    {
        return e.value();
    }
};
} // namespace kc::impl

/// Live, read-only view of the keys of a map in positional order.
template <class MapT>
struct kc::map_keys_view
{
    using key_t = typename MapT::key_t;
    using iterator = impl::map_projection_iterator<decltype(std::declval<MapT&>().begin()), impl::project_key>;

    explicit map_keys_view(MapT& map) : _map(&map) {}

    [[nodiscard]] iterator begin() const { return iterator(_map->begin()); }
    [[nodiscard]] iterator end() const { return iterator(_map->end()); }

    [[nodiscard]] isize size() const { return _map->size(); }
    [[nodiscard]] bool empty() const { return _map->empty(); }

    /// Key at position i; throws kc::index_out_of_range_error like ordered_map::key_at.
    [[nodiscard]] key_t const& operator[](isize i) const { return _map->key_at(i); }

    /// O(1) average, through the map's key index.
    [[nodiscard]] bool contains(key_t const& key) const { return _map->contains_key(key); }

private:
    MapT* _map;
};

/// Live view of the values of a map in positional order.
/// Values are mutable if MapT is non-const.
template <class MapT>
struct kc::map_values_view
{
    using iterator = impl::map_projection_iterator<decltype(std::declval<MapT&>().begin()), impl::project_value>;

    explicit map_values_view(MapT& map) : _map(&map) {}

    [[nodiscard]] iterator begin() const { return iterator(_map->begin()); }
    [[nodiscard]] iterator end() const { return iterator(_map->end()); }

    [[nodiscard]] isize size() const { return _map->size(); }
    [[nodiscard]] bool empty() const { return _map->empty(); }

    /// Value at position i; throws kc::index_out_of_range_error like ordered_map::value_at.
    [[nodiscard]] decltype(auto) operator[](isize i) const { return _map->value_at(i); }

private:
    MapT* _map;
};
