#include "./style.hpp"

#include <neo/platform.hpp>

#if NEO_OS_IS_WINDOWS
#include <windows.h>

bool scribe::detect_should_style() noexcept {
    auto err_console = ::GetStdHandle(STD_ERROR_HANDLE);
    if (err_console == INVALID_HANDLE_VALUE) {
        return false;
    }
    DWORD mode = 0;
    if (!::GetConsoleMode(err_console, &mode)) {
        return false;
    }
    return (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING);
}
#else
#include <unistd.h>
bool scribe::detect_should_style() noexcept { return ::isatty(STDERR_FILENO); }
#endif

std::string scribe::stylize(std::string_view text, fmt::text_style style, should_style should) {
    static const bool is_terminal = detect_should_style();
    const bool        do_style    = (should == should_style::force)
                  ? true
                  : (should == should_style::never ? false : is_terminal);
    if (!do_style) {
        return std::string(text);
    }
    return fmt::format(style, "{}", text);
}
