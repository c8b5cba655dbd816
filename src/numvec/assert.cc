#include "assert.hh"

#include <numvec/assert-handler.hh>
#include <numvec/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef NV_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef NV_OS_LINUX
#include <cstring>
#endif

namespace
{
std::vector<nv::impl::assertion_handler> g_handlers;

void print_assertion_failure(nv::impl::assertion_info const& info)
{
    std::cerr << "numvec: assertion `" << info.expression << "` failed\n"
              << "  " << info.message << '\n'
              << "  at " << info.location.file_name() << ':' << info.location.line() << " in "
              << info.location.function_name() << "\n\n"
              << nv::stacktrace::current(1) << std::endl;
}

#ifdef NV_OS_LINUX
// the "TracerPid:" line of /proc/self/status is non-zero while a debugger is attached
bool linux_has_tracer()
{
    auto const f = std::fopen("/proc/self/status", "r");
    if (!f)
        return false;

    auto pid = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), f))
        if (std::strncmp(line, "TracerPid:", 10) == 0)
        {
            pid = std::atoi(line + 10);
            break;
        }

    std::fclose(f);
    return pid != 0;
}
#endif
} // namespace

void nv::impl::push_assertion_handler(assertion_handler handler)
{
    g_handlers.push_back(std::move(handler));
}

void nv::impl::pop_assertion_handler()
{
    if (!g_handlers.empty())
        g_handlers.pop_back();
}

nv::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    nv::impl::push_assertion_handler(std::move(handler));
}

nv::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    nv::impl::pop_assertion_handler();
}

void nv::impl::handle_assert_failure(char const* expression, char const* message, nv::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (g_handlers.empty())
        print_assertion_failure(info);
    else
        g_handlers.back()(info);
}

bool nv::impl::is_debugger_connected() noexcept
{
#if defined(NV_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(NV_OS_LINUX)
    return linux_has_tracer();
#else
    return false;
#endif
}

void nv::impl::perform_abort() noexcept
{
    std::abort();
}
