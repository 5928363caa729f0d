#pragma once

#include <keyed-core/assert.hh>
#include <keyed-core/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size.
/// Trivially copyable regardless of T's triviality.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
///
/// ordered_map uses spans for everything crossing its boundary in bulk:
/// seed sequences (span<pair<K, V> const>) and copy-out buffers (span<pair<K, V>>).
template <class T>
struct kc::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        KC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows calling m.add_range({{1, 'a'}, {2, 'b'}}).
    /// WARNING: initializer_list temporaries are destroyed at the end of the full expression.
    /// Safe ONLY as an immediate function argument.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Creates a span from any container providing .data() and .size().
    /// The container must outlive the span.
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// Mutable spans convert to const spans.
    template <class U>
        requires(std::is_same_v<U const, T> && !std::is_same_v<U, T>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        KC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        KC_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        KC_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    /// May be nullptr if the span is default-constructed or empty.
    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
