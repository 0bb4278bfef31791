#pragma once

#include <micro-map/assert.hh>

#include <functional>
#include <string>

namespace mm::impl
{
// Customizable assertion handlers
// NOTE: the handler stack is global state and must be externally synchronized
//
// A handler is called with the failure details before the program aborts.
// Handlers may throw to unwind to a recovery point instead. Every container operation in this
// library checks its preconditions before touching any element, so a throwing handler leaves the
// container exactly as it was before the failed call:
//
//   {
//       auto handler = mm::impl::scoped_assertion_handler([](mm::impl::assertion_info const& info) {
//           throw capacity_error{info.message};
//       });
//       map.insert(key, value); // full map: throws capacity_error, map unchanged
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    mm::source_location location;
};

// Push a custom handler; it receives all assertion failures until popped
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler (no-op if none is installed)
// NOTE: prefer scoped_assertion_handler so throwing handlers are popped during unwinding
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
} // namespace mm::impl
