#pragma once

#include <keyed-core/fwd.hh>
#include <keyed-core/utility.hh>

// Low-level object lifetime primitives used by kc::vector.
// All functions operate on raw pointer ranges and follow one convention:
// the pointer passed by reference is advanced (or retreated) _after_ each successful construction,
// so that it always delimits the live range even when a constructor throws halfway through.

namespace kc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Default-constructs `count` objects at dest_end, advancing dest_end per constructed object.
/// IMPORTANT: [dest_end, dest_end + count) must be uninitialized memory.
/// All objects are initialized via T(), so trivial types (e.g. int) are zero-initialized.
template <class T>
constexpr void default_create_objects_to(T*& dest_end, isize count)
{
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (kc::placement_new, dest_end) T();
        ++dest_end;
    }
}

/// Copy-constructs `count` objects from a single value at dest_end, advancing dest_end per constructed object.
/// IMPORTANT: [dest_end, dest_end + count) must be uninitialized memory.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (kc::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end) at dest_end, advancing dest_end per constructed object.
/// IMPORTANT: the destination must be uninitialized memory.
/// Trivially copyable types are copied with memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            kc::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (kc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) at dest_end, advancing dest_end per constructed object.
/// IMPORTANT: the destination must be uninitialized memory.
/// The source objects stay alive (moved-from) and must still be destroyed by their owner.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            kc::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (kc::placement_new, dest_end) T(kc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) in reverse order so that they end right before dest_start.
/// dest_start is decremented per constructed object.
/// IMPORTANT: [dest_start - (src_end - src_start), dest_start) must be uninitialized memory.
template <class T>
constexpr void move_create_objects_to_reverse(T*& dest_start, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            dest_start -= size;
            kc::memcpy(dest_start, src_start, size * sizeof(T));
        }
    }
    else
    {
        while (src_start != src_end)
        {
            --src_end;
            new (kc::placement_new, dest_start - 1) T(kc::move(*src_end));
            --dest_start; // _after_ construction so exceptions leave dest_start pointing to the constructed range
        }
    }
}

/// Move-assigns [src_start, src_end) onto the live objects starting at dest, front to back.
/// Used to close a gap: dest < src_start, ranges may overlap.
/// Afterwards the last (src_end - src_start) objects before src_end hold moved-from values.
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    // checked in this context: element types may grant assignment to kc::impl only
    static_assert(requires(T& a, T& b) { a = kc::move(b); }, "T must be move assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
            kc::memmove(dest, src_start, size * sizeof(T));
    }
    else
    {
        while (src_start != src_end)
        {
            *dest = kc::move(*src_start);
            ++dest;
            ++src_start;
        }
    }
}

/// Opens a one-element gap at `pos` inside the live range [pos, *obj_end) by shifting it one slot to the back.
/// The slot at *obj_end must be uninitialized memory; *obj_end is incremented once the new last object exists.
/// Precondition: pos < *obj_end.
/// Afterwards *pos is alive but moved-from and is meant to be assigned by the caller.
template <class T>
constexpr void shift_move_objects_forward(T* pos, T*& obj_end)
{
    static_assert(std::is_move_constructible_v<T> && requires(T& a, T& b) { a = kc::move(b); },
                  "T must be move constructible and move assignable");

    auto const last = obj_end - 1;
    new (kc::placement_new, obj_end) T(kc::move(*last));
    ++obj_end;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = last - pos;
        if (size > 0)
            kc::memmove(pos + 1, pos, size * sizeof(T));
    }
    else
    {
        for (auto p = last; p != pos; --p)
            *p = kc::move(*(p - 1));
    }
}
} // namespace kc::impl
