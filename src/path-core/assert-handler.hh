#pragma once

#include <path-core/assert.hh>

#include <functional>
#include <string>

namespace pc::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = pc::impl::scoped_assertion_handler([](pc::impl::assertion_info const& info) {
//           report(info);
//           throw contract_violation{info.message};
//       });
//
//       auto c = str[17]; // out of range: handler runs and unwinds
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    pc::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers are allowed to throw to unwind to a recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// Prefer scoped_assertion_handler, which also pops when a handler throws
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
} // namespace pc::impl
