#pragma once

#include <long-bytes/fwd.hh>

#include <functional>
#include <string>

namespace lb::impl
{
// Customizable assertion handler stack
// NOTE: Handler functions are global state and must be externally synchronized
//
// Tests install a throwing handler to observe invariant violations without aborting:
//   {
//       auto handler = lb::impl::scoped_assertion_handler([](lb::impl::assertion_info const& info) {
//           throw info;
//       });
//       ...
//   } // popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    lb::source_location location;
};

// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pops the topmost handler, no-op if the stack is empty
void pop_assertion_handler();

struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace lb::impl
