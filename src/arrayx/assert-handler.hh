#pragma once

#include <arrayx/macros.hh>
#include <arrayx/source_location.hh>

#include <functional>
#include <string>

namespace ax::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = ax::impl::scoped_assertion_handler([](ax::impl::assertion_info const& info) {
//           report_to_crash_log(info);
//           throw assertion_failure_exception{info.message};
//       });
//
//       // Any assertions in this scope will use the custom handler
//       risky_operation();
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    ax::source_location location;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler, which pops even when the handler throws
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ax::impl
