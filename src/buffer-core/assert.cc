#include "assert.hh"

#include <buffer-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef BC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef BC_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(bc::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(bc::impl::assertion_info const& info)
{
    std::cerr << "Contract violation (" << bc::impl::to_string(info.kind) << "): " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
}
} // namespace

void bc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void bc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

bc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

bc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

char const* bc::impl::to_string(bc::violation kind)
{
    switch (kind)
    {
    case bc::violation::assertion:
        return "assertion";
    case bc::violation::index_out_of_range:
        return "index out of range";
    case bc::violation::capacity_exceeded:
        return "capacity exceeded";
    }
    return "unknown violation";
}

BC_COLD_FUNC void bc::impl::handle_assert_failure(bc::violation kind,
                                                  char const* expression,
                                                  char const* message,
                                                  bc::source_location location)
{
    assertion_info const info{
        .kind = kind,
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    // Call the topmost handler if available, otherwise use default handler
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool bc::impl::is_debugger_connected() noexcept
{
#ifdef BC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(BC_OS_LINUX)
    // Check /proc/self/status for TracerPid
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

[[noreturn]] void bc::impl::perform_abort() noexcept
{
    std::abort();
}
