#pragma once

#include <keyed-core/macros.hh>
#include <keyed-core/source_location.hh>

#include <functional>
#include <string>

/// Replaceable reaction to a failed KC_ASSERT / KC_ASSERT_ALWAYS.
///
/// Failures go to the innermost installed handler, or print to stderr if none is installed.
/// After the handler returns, the process breaks into the debugger (if attached) and aborts.
/// A handler that throws unwinds out of the failing container call instead,
/// which is how the tests observe precondition violations of kc::vector and kc::span:
///
///   auto handler = kc::impl::scoped_assertion_handler([](kc::impl::assertion_info const& info) {
///       throw precondition_violated{info.message};
///   });
///   (void)v[v.size()]; // throws precondition_violated
///
/// The handler stack is process-global and not synchronized.
namespace kc::impl
{
struct assertion_info
{
    /// the stringified condition, e.g. "0 <= i && i < size()"
    std::string expression;
    std::string message;
    /// site of the KC_ASSERT, i.e. inside keyed-core for container preconditions
    kc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// Does nothing if no handler is installed.
void pop_assertion_handler();

/// Installs a handler for the lifetime of this object.
/// Pops even when a throwing handler unwinds through the scope.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace kc::impl
