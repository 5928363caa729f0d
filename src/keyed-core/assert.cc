#include "assert.hh"

#include <keyed-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <format>
#include <utility>
#include <vector>

#ifdef KC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef KC_OS_LINUX
#include <fstream>
#include <string>
#endif

namespace
{
std::vector<kc::impl::assertion_handler>& assertion_handlers()
{
    static std::vector<kc::impl::assertion_handler> handlers;
    return handlers;
}

void print_assertion_failure(kc::impl::assertion_info const& info)
{
    auto const text = std::format("keyed-core: assertion `{}` failed: {}\n  at {}:{}:{} ({})\n", info.expression,
                                  info.message, info.location.file_name(), info.location.line(),
                                  info.location.column(), info.location.function_name());
    std::fputs(text.c_str(), stderr);
    std::fflush(stderr);
}
} // namespace

void kc::impl::push_assertion_handler(assertion_handler handler)
{
    assertion_handlers().push_back(std::move(handler));
}

void kc::impl::pop_assertion_handler()
{
    auto& handlers = assertion_handlers();
    if (!handlers.empty())
        handlers.pop_back();
}

kc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

kc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

KC_COLD_FUNC void kc::impl::handle_assert_failure(char const* expression, char const* message, kc::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = assertion_handlers();
    if (handlers.empty())
        print_assertion_failure(info);
    else
        handlers.back()(info);
}

bool kc::impl::is_debugger_connected() noexcept
{
#ifdef KC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(KC_OS_LINUX)
    // "TracerPid:\t<pid>", non-zero while traced
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
    {
        if (line.starts_with("TracerPid:"))
            return line.find_first_of("123456789", 10) != std::string::npos;
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void kc::impl::perform_abort() noexcept
{
    std::abort();
}
