#pragma once

#include <numvec/macros.hh>
#include <numvec/source_location.hh>

// =========================================================================================================
// Precondition checks
// =========================================================================================================
//
// numvec reports every misuse of its API as a failed precondition of the caller.
// There are no error codes and no exceptions thrown by the library itself:
//
//   NV_ASSERT(cond, msg)          - debug check, compiled out unless NV_ASSERT_ENABLED
//   NV_ASSERT_ALWAYS(cond, msg)   - checked in every build
//
// The documented failure modes of the public API always use the _ALWAYS variants and start
// their message with the error kind:
//
//   "invalid interval: ..."   range / linspace / uniform with start >= stop
//   "length mismatch: ..."    vector-vector arithmetic on vectors of different sizes
//   "out of bounds: ..."      indexing, front/back on empty vectors, slicing
//
// Type-level misuse (max() on floating point vectors, normal() on float, ...) does not compile
// and never reaches these macros.
//
// A failed check calls the active handler (see <numvec/assert-handler.hh>), then breaks into an
// attached debugger and aborts. A handler may throw to unwind instead, which is how the tests
// observe failures.
//
// msg must be a string literal. Formatted messages live in <numvec/assertf.hh>.
//
#define NV_ASSERT(cond, msg) NV_IMPL_ASSERT(cond, msg)
#define NV_ASSERT_ALWAYS(cond, msg) NV_IMPL_ASSERT_ALWAYS(cond, msg)

// breaks into the debugger if one is attached, no-op otherwise
#define NV_DEBUG_BREAK() NV_IMPL_DEBUG_BREAK()

// called after the handler returned normally
#define NV_BREAK_AND_ABORT() (NV_DEBUG_BREAK(), ::nv::impl::perform_abort())


namespace nv::impl
{
// builds the assertion_info and calls the topmost handler, or prints to stderr without one
// does not abort, the macro does that so the debugger stops at the call site
NV_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, nv::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace nv::impl

#if defined(NV_COMPILER_MSVC)
#define NV_IMPL_DEBUG_BREAK() (::nv::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// 5 is SIGTRAP, declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define NV_IMPL_DEBUG_BREAK() (::nv::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

#define NV_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::nv::impl::handle_assert_failure(#cond, msg, ::nv::source_location::current()); \
            NV_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if NV_ASSERT_ENABLED
#define NV_IMPL_ASSERT(cond, msg) NV_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define NV_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        NV_UNUSED(cond);          \
        NV_UNUSED(msg);           \
    } while (false)
#endif
