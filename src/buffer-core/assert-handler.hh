#pragma once

#include <buffer-core/assert.hh>

#include <functional>
#include <string>

namespace bc::impl
{
// Customizable handler for contract violations
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = bc::impl::scoped_assertion_handler([](bc::impl::assertion_info const& info) {
//           if (info.kind == bc::violation::index_out_of_range)
//               throw my_index_error{info.message};
//           throw my_contract_error{info.message};
//       });
//
//       // Any failed check in this scope will use the custom handler
//       buf.insert_at(idx, value);
//   } // handler is automatically popped here

struct assertion_info
{
    bc::violation kind = bc::violation::assertion;
    std::string expression;
    std::string message;
    bc::source_location location;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all failed checks until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
// All buffer-core checks run before mutation, so unwinding leaves containers unchanged
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler so that each push is matched with a pop even if a handler throws
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

// Human-readable name of a violation kind, e.g. "index out of range"
[[nodiscard]] char const* to_string(bc::violation kind);
} // namespace bc::impl
