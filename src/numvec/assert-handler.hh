#pragma once

#include <numvec/source_location.hh>

#include <functional>
#include <string>

// Replaceable reaction to failed NV_ASSERT* checks.
//
// Without a handler, failures are printed to stderr with a stacktrace and the process aborts.
// A pushed handler replaces the printing. If it returns, the process still aborts,
// so a handler that wants to recover has to throw:
//
//   auto handler = nv::impl::scoped_assertion_handler([](nv::impl::assertion_info const& info) {
//       throw std::invalid_argument(info.message);
//   });
//   auto sum = a + b; // a length mismatch now throws std::invalid_argument
//
// The handler stack is global and not synchronized.

namespace nv::impl
{
struct assertion_info
{
    std::string expression; // stringified condition
    std::string message;    // formatted message, starts with the error kind for API failures
    nv::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

// pushes on construction, pops on destruction (also while unwinding from a throwing handler)
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace nv::impl
