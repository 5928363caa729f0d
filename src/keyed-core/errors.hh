#pragma once

#include <keyed-core/fwd.hh>
#include <keyed-core/macros.hh>
#include <keyed-core/source_location.hh>

#include <exception>
#include <string>

// =========================================================================================================
// Error taxonomy of kc::ordered_map
// =========================================================================================================
//
// Caller-recoverable failures are thrown as exceptions derived from kc::map_error.
// Each error carries a message and the source location it was raised at.
// A throwing operation never leaves the map partially mutated
// (add_range / create_from keep the pairs applied before the failing one).
//
//   duplicate_key_error       - add, add_range, insert_at, create_from: key already present
//   key_not_found_error       - get: key absent (use try_get for a non-throwing lookup)
//   index_out_of_range_error  - get_at, key_at, value_at, insert_at, remove_at, copy_to: position outside bounds
//   invalid_argument_error    - reserve: negative capacity; copy_to: range exceeds source or destination
//
// Programmer errors inside the low-level containers are KC_ASSERTs, not exceptions.
//
// Usage:
//   try
//   {
//       m.add(key, value);
//   }
//   catch (kc::duplicate_key_error const& e)
//   {
//       std::cerr << e.to_string();
//   }
//

/// Base class of all errors thrown by keyed-core containers.
struct kc::map_error : std::exception
{
    explicit map_error(std::string message, kc::source_location site = kc::source_location::current());

    [[nodiscard]] char const* what() const noexcept override;

    [[nodiscard]] std::string const& message() const { return _message; }
    [[nodiscard]] kc::source_location site() const { return _site; }

    /// Multi-line description:
    ///   error: <message>
    ///     at <file>:<line> - <function>
    [[nodiscard]] std::string to_string() const;

private:
    std::string _message;
    kc::source_location _site;
};

/// The key is already stored in the container.
struct kc::duplicate_key_error : kc::map_error
{
    using map_error::map_error;
};

/// The key is not stored in the container.
struct kc::key_not_found_error : kc::map_error
{
    using map_error::map_error;
};

/// A position lies outside the valid range [0, size()) (or [0, size()] for insertion).
struct kc::index_out_of_range_error : kc::map_error
{
    index_out_of_range_error(std::string message,
                             isize index,
                             isize size,
                             kc::source_location site = kc::source_location::current());

    /// The offending position.
    [[nodiscard]] isize index() const { return _index; }
    /// Size of the range the position was checked against.
    [[nodiscard]] isize size() const { return _size; }

private:
    isize _index;
    isize _size;
};

/// An argument is invalid independent of any single position (negative capacity, oversized range).
struct kc::invalid_argument_error : kc::map_error
{
    using map_error::map_error;
};

namespace kc::impl
{
// Out-of-line throw helpers, kept off the hot paths of the inlined container code

[[noreturn]] KC_COLD_FUNC void throw_duplicate_key(kc::source_location site = kc::source_location::current());

[[noreturn]] KC_COLD_FUNC void throw_key_not_found(kc::source_location site = kc::source_location::current());

/// `operation` names the rejected call; valid positions are [0, end) (or [0, end] if end_inclusive).
[[noreturn]] KC_COLD_FUNC void throw_index_out_of_range(char const* operation,
                                                        isize index,
                                                        isize end,
                                                        bool end_inclusive,
                                                        kc::source_location site = kc::source_location::current());

[[noreturn]] KC_COLD_FUNC void throw_invalid_argument(std::string message,
                                                      kc::source_location site = kc::source_location::current());
} // namespace kc::impl
