#pragma once

#include <keyed-core/assert.hh>
#include <keyed-core/fwd.hh>
#include <keyed-core/impl/object_lifetime_util.hh>
#include <keyed-core/span.hh>
#include <keyed-core/utility.hh>

#include <limits>
#include <new>


/// Dynamically allocated vector of T elements with value semantics.
/// Similar to std::vector, restricted to what an ordered sequence needs:
/// growth at the back, positional insert/remove that preserves order, and explicit capacity control.
///
/// Storage is a single buffer with a live object window:
/// - [alloc_start, alloc_end) is the owned memory, in units of T
/// - [obj_start, obj_end) are the live objects, always starting at alloc_start for a vector
///
/// === Exception & reference guarantees ===
///
/// Allocation failures leave the vector unchanged.
/// Capacity may increase even if a subsequent element construction fails.
/// Element construction failures leave size and live range unchanged.
///
/// Reallocation always uses move construction (no copy fallback).
/// If a move throws during reallocation, the vector remains structurally valid
/// (size, bounds, iteration correct), but some elements may be in moved-from state.
///
/// The old buffer remains valid until the new element is constructed.
/// Constructing from existing elements (e.g. `emplace_back(v[i])`, `insert_at(0, v[3])`) is safe during growth.
///
/// Any reallocation invalidates pointers, references, and iterators.
/// Positional insert/remove invalidate pointers and references at and after the position.
template <class T>
struct kc::vector
{
    /// Minimum alignment of heap buffers.
    /// One cache line (64 bytes on every platform we target) so that distinct vectors never share a line.
    static constexpr isize alloc_alignment = alignof(T) > 64 ? isize(alignof(T)) : isize(64);

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        KC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        KC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        KC_ASSERT(!empty(), "vector is empty");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        KC_ASSERT(!empty(), "vector is empty");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        KC_ASSERT(!empty(), "vector is empty");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        KC_ASSERT(!empty(), "vector is empty");
        return *(_data.obj_end - 1);
    }

    /// Returns a pointer to the underlying contiguous storage.
    /// May be nullptr if the vector never allocated.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// Number of elements that can be stored without reallocation.
    [[nodiscard]] constexpr isize capacity() const { return _data.alloc_end - _data.alloc_start; }

    /// How many elements can be appended without reallocation.
    [[nodiscard]] constexpr isize capacity_back() const { return _data.alloc_end - _data.obj_end; }

    [[nodiscard]] constexpr bool has_capacity_back_for(isize count) const { return capacity_back() >= count; }

    // factories
public:
    /// Vector with reserved capacity but no live objects.
    /// Guarantees at least "capacity" elements can be appended without reallocation.
    [[nodiscard]] static vector create_with_capacity(isize capacity)
    {
        KC_ASSERT(capacity >= 0, "capacity must be non-negative");
        vector v;
        v._data = buffer::create(capacity);
        return v;
    }

    /// Vector with "size" many value-initialized elements.
    [[nodiscard]] static vector create_defaulted(isize size)
    {
        auto v = vector::create_with_capacity(size);
        impl::default_create_objects_to(v._data.obj_end, size);
        return v;
    }

    /// Vector with "size" many elements, all copy-constructed from "value".
    [[nodiscard]] static vector create_filled(isize size, T const& value)
    {
        auto v = vector::create_with_capacity(size);
        impl::fill_create_objects_to(v._data.obj_end, size, value);
        return v;
    }

    /// Deep copy of the provided span.
    [[nodiscard]] static vector create_copy_of(kc::span<T const> source)
    {
        auto v = vector::create_with_capacity(source.size());
        impl::copy_create_objects_to(v._data.obj_end, source.data(), source.data() + source.size());
        return v;
    }

    // capacity management
public:
    /// Ensures capacity() >= min_capacity without changing size or element values.
    /// Strong guarantee for allocation failure; no-op if the capacity is already sufficient.
    /// Throws std::bad_alloc if min_capacity elements exceed the addressable size.
    void reserve(isize min_capacity)
    {
        KC_ASSERT(min_capacity >= 0, "capacity must be non-negative");
        if (min_capacity <= capacity())
            return;

        auto new_data = buffer::create(min_capacity);
        impl::move_create_objects_to(new_data.obj_end, _data.obj_start, _data.obj_end);
        _data = kc::move(new_data);
    }

    // modifiers
public:
    /// Destroys all elements, size becomes 0. Capacity is kept.
    void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    /// Appends a new element to the back, allocating if necessary.
    /// Amortized O(1) complexity.
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(kc::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        if (!has_capacity_back_for(1)) [[unlikely]]
            return grow_and_emplace_at(size(), kc::forward<Args>(args)...);

        auto const p = new (kc::placement_new, _data.obj_end) T(kc::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave state valid
        return *p;
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(kc::move(value)); }

    /// Constructs a new element at position idx, shifting [idx, size()) one slot to the back.
    /// idx == size() appends.
    /// Precondition: 0 <= idx <= size().
    /// O(n) complexity.
    template <class... Args>
    T& emplace_at(isize idx, Args&&... args)
    {
        static_assert(
            requires { T(kc::forward<Args>(args)...); }, "emplace_at: T is not constructible from "
                                                         "the provided argument types");
        KC_ASSERT(0 <= idx && idx <= size(), "insert position out of bounds");

        if (!has_capacity_back_for(1)) [[unlikely]]
            return grow_and_emplace_at(idx, kc::forward<Args>(args)...);

        if (idx == size())
        {
            auto const p = new (kc::placement_new, _data.obj_end) T(kc::forward<Args>(args)...);
            _data.obj_end++;
            return *p;
        }

        // construct first: args may reference elements that are about to shift
        // and a throwing T(...) must leave the vector untouched
        T value(kc::forward<Args>(args)...);
        auto const p_obj = _data.obj_start + idx;
        impl::shift_move_objects_forward(p_obj, _data.obj_end);
        *p_obj = kc::move(value);
        return *p_obj;
    }

    T& insert_at(isize idx, T const& value) { return emplace_at(idx, value); }
    T& insert_at(isize idx, T&& value) { return emplace_at(idx, kc::move(value)); }

    // removals
public:
    /// Removes and returns the last element by move.
    /// Precondition: !empty().
    [[nodiscard("use remove_back() if you don't need the return value")]] T pop_back()
    {
        KC_ASSERT(!empty(), "cannot pop from empty vector");
        auto value = kc::move(*(_data.obj_end - 1));
        (_data.obj_end - 1)->~T();
        _data.obj_end--;
        return value;
    }

    /// Removes the last element.
    /// Precondition: !empty().
    void remove_back()
    {
        KC_ASSERT(!empty(), "cannot remove from empty vector");
        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Removes the element at the given index, shifting later elements one slot to the front.
    /// Precondition: 0 <= idx < size().
    /// O(n) complexity due to element compaction.
    void remove_at(isize idx)
    {
        KC_ASSERT(0 <= idx && idx < size(), "index out of bounds");
        auto const p_obj = _data.obj_start + idx;

        // Compact remaining elements backward (move-assigns over p_obj)
        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);

        // The last element is now in moved-from state; destroy it and shrink
        _data.obj_end--;
        _data.obj_end->~T();
    }

    // value semantics
public:
    vector() = default;
    ~vector() = default;
    vector(vector&&) = default;
    vector& operator=(vector&&) = default;

    vector(vector const& rhs) : _data(buffer::create(rhs.size()))
    {
        impl::copy_create_objects_to(_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
    }
    vector& operator=(vector const& rhs)
    {
        if (this != &rhs)
        {
            auto new_data = buffer::create(rhs.size());
            impl::copy_create_objects_to(new_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
            _data = kc::move(new_data);
        }
        return *this;
    }

    // implementation
private:
    /// Owned memory plus live object window; destroys live objects and frees memory on destruction.
    /// A temporary buffer under construction owns exactly the objects constructed so far.
    struct buffer
    {
        T* alloc_start = nullptr;
        T* alloc_end = nullptr;
        T* obj_start = nullptr;
        T* obj_end = nullptr;

        [[nodiscard]] static buffer create(isize capacity)
        {
            buffer b;
            if (capacity == 0)
                return b;

            if (capacity > (std::numeric_limits<isize>::max() - alloc_alignment) / isize(sizeof(T))) [[unlikely]]
                throw std::bad_alloc();

            // round up to whole cache lines, the tail is usable capacity
            auto const bytes = (capacity * isize(sizeof(T)) + alloc_alignment - 1) / alloc_alignment * alloc_alignment;
            b.alloc_start = static_cast<T*>(::operator new(std::size_t(bytes), std::align_val_t(alloc_alignment)));
            b.alloc_end = b.alloc_start + bytes / isize(sizeof(T));
            b.obj_start = b.alloc_start;
            b.obj_end = b.alloc_start;
            return b;
        }

        buffer() = default;
        buffer(buffer&& rhs) noexcept
          : alloc_start(kc::exchange(rhs.alloc_start, nullptr)),
            alloc_end(kc::exchange(rhs.alloc_end, nullptr)),
            obj_start(kc::exchange(rhs.obj_start, nullptr)),
            obj_end(kc::exchange(rhs.obj_end, nullptr))
        {
        }
        buffer& operator=(buffer&& rhs) noexcept
        {
            if (this != &rhs)
            {
                release();
                alloc_start = kc::exchange(rhs.alloc_start, nullptr);
                alloc_end = kc::exchange(rhs.alloc_end, nullptr);
                obj_start = kc::exchange(rhs.obj_start, nullptr);
                obj_end = kc::exchange(rhs.obj_end, nullptr);
            }
            return *this;
        }
        buffer(buffer const&) = delete;
        buffer& operator=(buffer const&) = delete;
        ~buffer() { release(); }

        void release() noexcept
        {
            impl::destroy_objects_in_reverse(obj_start, obj_end);
            if (alloc_start != nullptr)
                ::operator delete(alloc_start, std::align_val_t(alloc_alignment));
            alloc_start = alloc_end = obj_start = obj_end = nullptr;
        }
    };

    /// Exponential growth, at least min_capacity.
    [[nodiscard]] isize grow_capacity_for(isize min_capacity) const
    {
        return kc::max(capacity() << 1, kc::max(min_capacity, isize(4)));
    }

    /// Slow path of emplace_back / emplace_at when the buffer is full.
    /// The new element is constructed first, directly at its final place in the new buffer,
    /// so that args referencing old elements stay valid and a throwing T(...) leaves *this untouched.
    /// The temporary buffer's live window only covers what has been constructed so far.
    template <class... Args>
    KC_COLD_FUNC T& grow_and_emplace_at(isize idx, Args&&... args)
    {
        auto new_data = buffer::create(grow_capacity_for(size() + 1));
        new_data.obj_start = new_data.alloc_start + idx;
        new_data.obj_end = new_data.obj_start;

        auto const p = new (kc::placement_new, new_data.obj_end) T(kc::forward<Args>(args)...);
        new_data.obj_end++;

        auto const p_idx = _data.obj_start + idx;
        impl::move_create_objects_to(new_data.obj_end, p_idx, _data.obj_end);
        impl::move_create_objects_to_reverse(new_data.obj_start, _data.obj_start, p_idx);
        KC_ASSERT(new_data.obj_start == new_data.alloc_start, "relocation must fill the buffer front");

        _data = kc::move(new_data);
        return *p;
    }

    buffer _data;
};
