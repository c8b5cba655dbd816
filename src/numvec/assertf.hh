#pragma once

#include <numvec/assert.hh>

#include <format>

// Formatted variants of NV_ASSERT and NV_ASSERT_ALWAYS.
// The message is a std::format string, the arguments are only evaluated on failure:
//
//   NV_ASSERTF_ALWAYS(lhs.size() == rhs.size(), "length mismatch: {} != {}", lhs.size(), rhs.size());
//
#define NV_ASSERTF(cond, msg, ...) NV_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)
#define NV_ASSERTF_ALWAYS(cond, msg, ...) NV_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


#define NV_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::nv::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::nv::source_location::current());                          \
            NV_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if NV_ASSERT_ENABLED
#define NV_IMPL_ASSERTF(cond, msg, ...) NV_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)
#else
// the format string is still type-checked against the arguments
#define NV_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        NV_UNUSED(cond);                                        \
        NV_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)
#endif
