#include "assert.hh"

#include <arrayx/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef AX_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef AX_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(ax::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(ax::impl::assertion_info const& info)
{
    std::cerr << "arrayx assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
    std::cerr.flush();
}
} // namespace

void ax::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ax::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

ax::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

ax::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

AX_COLD_FUNC void ax::impl::handle_assert_failure(char const* expression, char const* message, ax::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool ax::impl::is_debugger_connected() noexcept
{
#ifdef AX_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(AX_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void ax::impl::perform_abort() noexcept
{
    std::abort();
}
