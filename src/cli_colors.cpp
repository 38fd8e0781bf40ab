#include "vaultsplit/cli_colors.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/env.hpp"

#include <iostream>
#include <optional>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace vaultsplit::cli {

namespace {
    std::optional<bool> g_forced;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors(DWORD handle_id) {
        HANDLE handle = GetStdHandle(handle_id);
        if (handle == INVALID_HANDLE_VALUE) {
            return false;
        }
        DWORD mode = 0;
        if (!GetConsoleMode(handle, &mode)) {
            return false;
        }
        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(handle, mode) != 0;
    }
#endif

    bool DetectTty(std::ostream& os) {
        if (&os == &std::cout) {
            bool tty = isatty(fileno(stdout)) != 0;
#if defined(_WIN32) || defined(_WIN64)
            tty = tty && EnableWindowsAnsiColors(STD_OUTPUT_HANDLE);
#endif
            return tty;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            bool tty = isatty(fileno(stderr)) != 0;
#if defined(_WIN32) || defined(_WIN64)
            tty = tty && EnableWindowsAnsiColors(STD_ERROR_HANDLE);
#endif
            return tty;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_forced) {
        return *g_forced;
    }
    if (env::IsEnabled(constants::kEnvNoColor)) {
        return false;
    }
    // stdout and stderr are checked separately: one may be piped.
    static const bool stdout_tty = DetectTty(std::cout);
    static const bool stderr_tty = DetectTty(std::cerr);
    if (&os == &std::cout) {
        return stdout_tty;
    }
    if (&os == &std::cerr || &os == &std::clog) {
        return stderr_tty;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_forced = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace vaultsplit::cli
