#pragma once

#include <keyed-core/assert.hh>
#include <keyed-core/errors.hh>
#include <keyed-core/fwd.hh>
#include <keyed-core/hash.hh>
#include <keyed-core/map_entry.hh>
#include <keyed-core/map_views.hh>
#include <keyed-core/pair.hh>
#include <keyed-core/span.hh>
#include <keyed-core/utility.hh>
#include <keyed-core/vector.hh>

#include <initializer_list>
#include <type_traits>

/// Insertion-ordered hash map: every entry is reachable by key in O(1) average and by position in O(1).
///
/// Two internal structures are kept in sync:
///   - _entries: kc::vector of map_entry in positional order (the iteration order)
///   - _slots:   open-addressing index (linear probing), each slot is empty (-1) or an entry position
/// A mutation either updates both or throws before touching either.
///
/// Positions are dense: entries occupy [0, size()) without gaps.
/// Appending keeps existing positions; insert_at / remove shift later positions by one (O(n)).
///
/// Keys are compared with KeyEqualT and hashed with HashT; both are fixed at construction.
/// Keys that compare equal must hash equal.
///
/// Errors (see errors.hh):
///   - duplicate_key_error:      add, add_range, create_from, insert_at with a key already present
///   - key_not_found_error:      get with an absent key
///   - index_out_of_range_error: positional access outside the valid range
///   - invalid_argument_error:   negative or oversized reserve, copy_to range exceeding source or destination
///
/// Iterators, references and views' iterators are invalidated by any mutation that adds or removes entries.
///
/// Usage:
///   auto m = kc::ordered_map<int, char>();
///   m.add(12, 'c');
///   m.add(11, 'b');
///   m.insert_at(0, 10, 'a');
///   for (auto const& [key, value] : m)
///       ...; // (10, 'a'), (12, 'c'), (11, 'b')
///
/// TODO: heterogeneous lookup (e.g. std::string_view for std::string keys) once HashT/KeyEqualT can opt in
template <class K, class V, class HashT, class KeyEqualT>
struct kc::ordered_map
{
    using key_t = K;
    using value_t = V;
    using entry_t = kc::map_entry<K, V>;
    using pair_t = kc::pair<K, V>;
    using hash_t = HashT;
    using key_equal_t = KeyEqualT;

    // after the point of no return, mutations only move entries around
    static_assert(std::is_nothrow_move_constructible_v<K> && std::is_nothrow_move_assignable_v<K>
                      && std::is_nothrow_move_constructible_v<V> && std::is_nothrow_move_assignable_v<V>,
                  "ordered_map requires keys and values with noexcept move construction and assignment");
    static_assert(!std::is_copy_assignable_v<entry_t> && !std::is_move_assignable_v<entry_t>,
                  "stored keys must not be replaceable through references to entries");

    // construction
public:
    /// Empty map without any allocation.
    ordered_map() = default;

    /// Empty map with the given key strategy.
    explicit ordered_map(HashT hash, KeyEqualT key_equal = {}) : _hash(kc::move(hash)), _key_equal(kc::move(key_equal))
    {
    }

    /// Empty map that can hold `capacity` entries without reallocating.
    /// Throws kc::invalid_argument_error if capacity is negative.
    [[nodiscard]] static ordered_map create_with_capacity(isize capacity, HashT hash = {}, KeyEqualT key_equal = {})
    {
        auto m = ordered_map(kc::move(hash), kc::move(key_equal));
        (void)m.reserve(capacity);
        return m;
    }

    /// Map seeded with `seed` in order.
    /// Throws kc::duplicate_key_error at the first pair whose key is already present.
    [[nodiscard]] static ordered_map create_from(kc::span<pair_t const> seed, HashT hash = {}, KeyEqualT key_equal = {})
    {
        auto m = ordered_map(kc::move(hash), kc::move(key_equal));
        (void)m.reserve(seed.size());
        m.add_range(seed);
        return m;
    }
    [[nodiscard]] static ordered_map create_from(std::initializer_list<pair_t> seed, HashT hash = {}, KeyEqualT key_equal = {})
    {
        return create_from(as_span(seed), kc::move(hash), kc::move(key_equal));
    }

    // properties
public:
    [[nodiscard]] isize size() const { return _entries.size(); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }

    /// Upper bound for reserve(): both the entries and the index stay addressable below it.
    static constexpr isize max_capacity = (isize(1) << 60) / isize(sizeof(entry_t) > sizeof(isize) ? sizeof(entry_t) : sizeof(isize));

    /// Number of entries the map can hold before any internal structure reallocates.
    [[nodiscard]] isize capacity() const { return kc::min(_entries.capacity(), _slots.size() / 4 * 3); }

    [[nodiscard]] HashT const& hash_function() const { return _hash; }
    [[nodiscard]] KeyEqualT const& key_eq() const { return _key_equal; }

    // lookup by key
public:
    /// Value stored under key.
    /// Throws kc::key_not_found_error if key is absent.
    [[nodiscard]] V& get(K const& key)
    {
        auto const pos = find_position(key, hash_of(key));
        if (pos < 0) [[unlikely]]
            impl::throw_key_not_found();
        return _entries[pos].value();
    }
    [[nodiscard]] V const& get(K const& key) const
    {
        auto const pos = find_position(key, hash_of(key));
        if (pos < 0) [[unlikely]]
            impl::throw_key_not_found();
        return _entries[pos].value();
    }

    /// Pointer to the value stored under key, nullptr if absent.
    /// Valid until the next mutation that adds or removes entries.
    [[nodiscard]] V* try_get(K const& key)
    {
        auto const pos = find_position(key, hash_of(key));
        return pos < 0 ? nullptr : &_entries[pos].value();
    }
    [[nodiscard]] V const* try_get(K const& key) const
    {
        auto const pos = find_position(key, hash_of(key));
        return pos < 0 ? nullptr : &_entries[pos].value();
    }

    [[nodiscard]] bool contains_key(K const& key) const { return find_position(key, hash_of(key)) >= 0; }

    /// True if key is present and its value compares equal (V::operator==) to value.
    [[nodiscard]] bool contains(K const& key, V const& value) const
    {
        auto const pos = find_position(key, hash_of(key));
        return pos >= 0 && _entries[pos].value() == value;
    }
    [[nodiscard]] bool contains(pair_t const& p) const { return contains(p.first, p.second); }

    /// Position of key, -1 if absent.
    [[nodiscard]] isize index_of(K const& key) const { return find_position(key, hash_of(key)); }

    // lookup by position
public:
    /// Throws kc::index_out_of_range_error unless 0 <= i < size().
    [[nodiscard]] entry_t& get_at(isize i)
    {
        check_position("get_at", i);
        return _entries[i];
    }
    [[nodiscard]] entry_t const& get_at(isize i) const
    {
        check_position("get_at", i);
        return _entries[i];
    }

    [[nodiscard]] K const& key_at(isize i) const
    {
        check_position("key_at", i);
        return _entries[i].key();
    }

    [[nodiscard]] V& value_at(isize i)
    {
        check_position("value_at", i);
        return _entries[i].value();
    }
    [[nodiscard]] V const& value_at(isize i) const
    {
        check_position("value_at", i);
        return _entries[i].value();
    }

    // views and iteration
public:
    /// Live view of all keys in positional order.
    [[nodiscard]] kc::map_keys_view<ordered_map> keys() { return kc::map_keys_view<ordered_map>(*this); }
    [[nodiscard]] kc::map_keys_view<ordered_map const> keys() const
    {
        return kc::map_keys_view<ordered_map const>(*this);
    }

    /// Live view of all values in positional order.
    [[nodiscard]] kc::map_values_view<ordered_map> values() { return kc::map_values_view<ordered_map>(*this); }
    [[nodiscard]] kc::map_values_view<ordered_map const> values() const
    {
        return kc::map_values_view<ordered_map const>(*this);
    }

    [[nodiscard]] entry_t* begin() { return _entries.begin(); }
    [[nodiscard]] entry_t* end() { return _entries.end(); }
    [[nodiscard]] entry_t const* begin() const { return _entries.begin(); }
    [[nodiscard]] entry_t const* end() const { return _entries.end(); }

    // adding
public:
    /// Appends (key, value).
    /// Throws kc::duplicate_key_error if key is present; the map is unchanged then.
    void add(K const& key, V const& value) { add_entry(key, value); }
    void add(K&& key, V&& value) { add_entry(kc::move(key), kc::move(value)); }
    void add(pair_t const& p) { add_entry(p.first, p.second); }
    void add(pair_t&& p) { add_entry(kc::move(p.first), kc::move(p.second)); }

    /// Appends all pairs in order.
    /// Not transactional: throws kc::duplicate_key_error at the first duplicate,
    /// pairs before it stay added, pairs after it are not attempted.
    void add_range(kc::span<pair_t const> pairs)
    {
        (void)reserve(size() + pairs.size());
        for (auto const& p : pairs)
            add_entry(p.first, p.second);
    }
    void add_range(std::initializer_list<pair_t> pairs) { add_range(as_span(pairs)); }

    /// Appends (key, value) unless key is present.
    /// Returns true if added; an existing entry is never modified.
    bool try_add(K const& key, V const& value)
    {
        auto const h = hash_of(key);
        if (find_position(key, h) >= 0)
            return false;
        emplace_new_at(size(), h, key, value);
        return true;
    }
    bool try_add(K&& key, V&& value)
    {
        auto const h = hash_of(key);
        if (find_position(key, h) >= 0)
            return false;
        emplace_new_at(size(), h, kc::move(key), kc::move(value));
        return true;
    }

    /// Replaces the value of an existing key in place (position unchanged), or appends (key, value).
    /// Returns the stored value.
    V& set(K const& key, V const& value) { return set_entry(key, value); }
    V& set(K&& key, V&& value) { return set_entry(kc::move(key), kc::move(value)); }

    /// Value under key, appending a value-initialized V if key is absent.
    V& operator[](K const& key)
        requires std::is_default_constructible_v<V>
    {
        auto const h = hash_of(key);
        auto const pos = find_position(key, h);
        if (pos >= 0)
            return _entries[pos].value();
        return emplace_new_at(size(), h, key).value();
    }
    V& operator[](K&& key)
        requires std::is_default_constructible_v<V>
    {
        auto const h = hash_of(key);
        auto const pos = find_position(key, h);
        if (pos >= 0)
            return _entries[pos].value();
        return emplace_new_at(size(), h, kc::move(key)).value();
    }

    /// Inserts (key, value) at position i, shifting entries at [i, size()) one position back.
    /// i == size() appends.
    /// Throws kc::index_out_of_range_error unless 0 <= i <= size(),
    /// kc::duplicate_key_error if key is present; the map is unchanged in both cases.
    /// O(n).
    void insert_at(isize i, K const& key, V const& value) { insert_entry_at(i, key, value); }
    void insert_at(isize i, K&& key, V&& value) { insert_entry_at(i, kc::move(key), kc::move(value)); }

    // removal
public:
    /// Removes the entry of key; later entries move one position to the front.
    /// Returns false (and changes nothing) if key is absent.
    /// O(n).
    bool remove(K const& key)
    {
        auto const slot = find_slot(key, hash_of(key));
        if (slot < 0)
            return false;
        remove_slot_and_entry(slot);
        return true;
    }

    /// Removes the entry of key only if its value compares equal to value.
    bool remove(K const& key, V const& value)
    {
        auto const slot = find_slot(key, hash_of(key));
        if (slot < 0 || !(_entries[_slots[slot]].value() == value))
            return false;
        remove_slot_and_entry(slot);
        return true;
    }
    bool remove(pair_t const& p) { return remove(p.first, p.second); }

    /// Removes the entry at position i.
    /// Throws kc::index_out_of_range_error unless 0 <= i < size().
    /// O(n).
    void remove_at(isize i)
    {
        check_position("remove_at", i);
        remove_slot_and_entry(slot_of_position(i));
    }

    /// Removes all entries. Allocated capacity is kept.
    void clear()
    {
        _entries.clear();
        for (auto& s : _slots)
            s = -1;
    }

    // capacity
public:
    /// Makes room for at least `capacity` entries without changing any observable state.
    /// Returns the effective capacity afterwards (>= capacity).
    /// Throws kc::invalid_argument_error if capacity is negative or above max_capacity.
    isize reserve(isize capacity)
    {
        if (capacity < 0) [[unlikely]]
            impl::throw_invalid_argument("reserve: capacity must be non-negative");
        if (capacity > max_capacity) [[unlikely]]
            impl::throw_invalid_argument("reserve: capacity exceeds max_capacity");

        ensure_slot_capacity_for(capacity);
        _entries.reserve(capacity);
        return this->capacity();
    }

    // copy-out
public:
    /// Copies `count` entries starting at source_index into dest[dest_offset, dest_offset + count).
    /// Other elements of dest are not touched.
    /// Throws kc::index_out_of_range_error if source_index, dest_offset or count is negative,
    /// kc::invalid_argument_error if the range exceeds size() or dest.size().
    void copy_to(isize source_index, kc::span<pair_t> dest, isize dest_offset, isize count) const
    {
        if (source_index < 0) [[unlikely]]
            impl::throw_index_out_of_range("copy_to (source index)", source_index, size(), true);
        if (dest_offset < 0) [[unlikely]]
            impl::throw_index_out_of_range("copy_to (destination offset)", dest_offset, dest.size(), true);
        if (count < 0) [[unlikely]]
            impl::throw_index_out_of_range("copy_to (count)", count, size(), true);
        // compared as differences, index + count may overflow
        if (source_index > size() || count > size() - source_index) [[unlikely]]
            impl::throw_invalid_argument("copy_to: source range exceeds the number of entries");
        if (dest_offset > dest.size() || count > dest.size() - dest_offset) [[unlikely]]
            impl::throw_invalid_argument("copy_to: destination is too small for the copied range");

        for (isize k = 0; k < count; ++k)
        {
            auto const& e = _entries[source_index + k];
            auto& d = dest[dest_offset + k];
            d.first = e.key();
            d.second = e.value();
        }
    }

    /// Copies all entries to dest[dest_offset, dest_offset + size()).
    void copy_to(kc::span<pair_t> dest, isize dest_offset = 0) const { copy_to(0, dest, dest_offset, size()); }

    // diagnostics
public:
    /// Verifies in O(n) that index and entries are consistent:
    /// every entry is found through the index at its own position, every used slot refers to a live entry,
    /// cached hashes are current, and the load factor is respected.
    [[nodiscard]] bool check_invariants() const
    {
        isize used_slots = 0;
        for (auto const s : _slots)
        {
            if (s < -1 || s >= size())
                return false;
            if (s >= 0)
                ++used_slots;
        }
        if (used_slots != size())
            return false;

        if (!_slots.empty() && !kc::is_power_of_two(_slots.size()))
            return false;
        if (size() * 4 > _slots.size() * 3)
            return false;

        for (isize p = 0; p < size(); ++p)
        {
            auto const& e = _entries[p];
            if (e.key_hash() != hash_of(e.key()))
                return false;
            if (find_position(e.key(), e.key_hash()) != p)
                return false;
        }
        return true;
    }

    // implementation
private:
    static constexpr isize min_slot_count = 8;

    static kc::span<pair_t const> as_span(std::initializer_list<pair_t> pairs)
    {
        return kc::span<pair_t const>(pairs.begin(), isize(pairs.size()));
    }

    [[nodiscard]] u64 hash_of(K const& key) const { return u64(_hash(key)); }

    [[nodiscard]] isize slot_mask() const { return _slots.size() - 1; }
    [[nodiscard]] isize home_slot(u64 h) const { return isize(h & u64(slot_mask())); }

    /// Smallest valid slot count holding `count` entries within the 3/4 load factor.
    /// Precondition: count <= max_capacity, so neither the product nor the power of two overflows.
    [[nodiscard]] static isize slot_count_for(isize count)
    {
        return kc::next_power_of_two(kc::max(min_slot_count, count * 4 / 3 + 1));
    }

    void check_position(char const* operation, isize i) const
    {
        if (i < 0 || i >= size()) [[unlikely]]
            impl::throw_index_out_of_range(operation, i, size(), false);
    }

    /// Slot holding key, -1 if absent.
    [[nodiscard]] isize find_slot(K const& key, u64 h) const
    {
        if (_slots.empty())
            return -1;

        auto const mask = slot_mask();
        auto i = home_slot(h);
        while (true)
        {
            auto const pos = _slots[i];
            if (pos < 0)
                return -1;

            auto const& e = _entries[pos];
            if (e.key_hash() == h && _key_equal(e.key(), key))
                return i;

            i = (i + 1) & mask;
        }
    }

    [[nodiscard]] isize find_position(K const& key, u64 h) const
    {
        auto const slot = find_slot(key, h);
        return slot < 0 ? -1 : _slots[slot];
    }

    /// Slot referring to position pos.
    /// Precondition: 0 <= pos < size().
    [[nodiscard]] isize slot_of_position(isize pos) const
    {
        auto const mask = slot_mask();
        auto i = home_slot(_entries[pos].key_hash());
        while (_slots[i] != pos)
        {
            KC_ASSERT(_slots[i] >= 0, "entry is missing from the index");
            i = (i + 1) & mask;
        }
        return i;
    }

    /// Grows the index so that `count` entries fit within the load factor.
    /// Only the index changes; it is rebuilt aside and swapped in, so a failed allocation changes nothing.
    void ensure_slot_capacity_for(isize count)
    {
        if (count * 4 <= _slots.size() * 3 && !_slots.empty())
            return;

        auto const slot_count = slot_count_for(count);
        if (slot_count <= _slots.size())
            return;

        auto slots = kc::vector<isize>::create_filled(slot_count, -1);
        auto const mask = slot_count - 1;
        for (isize p = 0; p < _entries.size(); ++p)
        {
            auto i = isize(_entries[p].key_hash() & u64(mask));
            while (slots[i] >= 0)
                i = (i + 1) & mask;
            slots[i] = p;
        }
        _slots = kc::move(slots);
    }

    /// Precondition: a free slot exists and no slot refers to pos yet.
    void insert_slot(u64 h, isize pos) noexcept
    {
        auto const mask = slot_mask();
        auto i = home_slot(h);
        while (_slots[i] >= 0)
            i = (i + 1) & mask;
        _slots[i] = pos;
    }

    /// Empties a slot and closes the probe gap by moving later members of the cluster back
    /// (backward shift deletion, no tombstones).
    /// Reads the cached hashes of the referenced entries, so it runs before _entries changes.
    void erase_slot(isize slot) noexcept
    {
        auto const mask = slot_mask();
        auto i = slot;
        auto j = slot;
        while (true)
        {
            j = (j + 1) & mask;
            if (_slots[j] < 0)
                break;

            auto const k = home_slot(_entries[_slots[j]].key_hash());

            // k cyclically in (i, j]: the member at j may stay
            if (i <= j ? (i < k && k <= j) : (i < k || k <= j))
                continue;

            _slots[i] = _slots[j];
            i = j;
        }
        _slots[i] = -1;
    }

    /// Adds delta to every slot referring to a position >= first.
    void shift_positions(isize first, isize delta) noexcept
    {
        for (auto& s : _slots)
            if (s >= first)
                s += delta;
    }

    /// Constructs a new entry at position pos and indexes it.
    /// Precondition: key is absent, 0 <= pos <= size().
    /// Everything that can throw (index growth, entry construction, entry storage growth)
    /// runs before the index is touched.
    template <class KeyT, class... Args>
    entry_t& emplace_new_at(isize pos, u64 h, KeyT&& key, Args&&... value_args)
    {
        ensure_slot_capacity_for(size() + 1);
        auto& e = _entries.emplace_at(pos, h, kc::forward<KeyT>(key), kc::forward<Args>(value_args)...);

        // point of no return
        if (pos + 1 < size())
            shift_positions(pos, +1);
        insert_slot(h, pos);
        return e;
    }

    template <class KeyT, class ValueT>
    void add_entry(KeyT&& key, ValueT&& value)
    {
        auto const h = hash_of(key);
        if (find_slot(key, h) >= 0) [[unlikely]]
            impl::throw_duplicate_key();
        emplace_new_at(size(), h, kc::forward<KeyT>(key), kc::forward<ValueT>(value));
    }

    template <class KeyT, class ValueT>
    V& set_entry(KeyT&& key, ValueT&& value)
    {
        auto const h = hash_of(key);
        auto const pos = find_position(key, h);
        if (pos >= 0)
        {
            auto& v = _entries[pos].value();
            v = kc::forward<ValueT>(value);
            return v;
        }
        return emplace_new_at(size(), h, kc::forward<KeyT>(key), kc::forward<ValueT>(value)).value();
    }

    template <class KeyT, class ValueT>
    void insert_entry_at(isize i, KeyT&& key, ValueT&& value)
    {
        if (i < 0 || i > size()) [[unlikely]]
            impl::throw_index_out_of_range("insert_at", i, size(), true);

        auto const h = hash_of(key);
        if (find_slot(key, h) >= 0) [[unlikely]]
            impl::throw_duplicate_key();
        emplace_new_at(i, h, kc::forward<KeyT>(key), kc::forward<ValueT>(value));
    }

    /// Removes the entry referenced by slot from both structures. Does not throw.
    void remove_slot_and_entry(isize slot) noexcept
    {
        auto const pos = _slots[slot];
        auto const was_last = pos + 1 == size();

        erase_slot(slot);
        _entries.remove_at(pos);
        if (!was_last)
            shift_positions(pos + 1, -1);
    }

private:
    kc::vector<entry_t> _entries;
    kc::vector<isize> _slots; // empty or a power of two; -1 = free, otherwise a position in _entries
    [[no_unique_address]] HashT _hash;
    [[no_unique_address]] KeyEqualT _key_equal;
};
