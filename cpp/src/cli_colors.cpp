#include "neo/cli_colors.hpp"

#include "neo/env.hpp"

#include <iostream>

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

namespace neo::cli {

namespace {
    bool g_colors_enabled = true;
    bool g_colors_checked = false;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors() {
        HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
        if (hOut == INVALID_HANDLE_VALUE) {
            return false;
        }

        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode)) {
            return false;
        }

        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(hOut, mode) != 0;
    }
#endif

    void Emit(const char* tag, const char* tag_color, const std::string& message) {
        std::cerr << Colorize(tag, tag_color) << " " << message << "\n";
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (!g_colors_checked) {
        bool is_tty = false;
        if (&os == &std::cout) {
            is_tty = isatty(fileno(stdout)) != 0;
        } else if (&os == &std::cerr) {
            is_tty = isatty(fileno(stderr)) != 0;
        }

        g_colors_enabled = is_tty && !neo::env::IsEnabled("NEO_NO_COLOR");

#if defined(_WIN32) || defined(_WIN64)
        if (g_colors_enabled) {
            g_colors_enabled = EnableWindowsAnsiColors();
        }
#endif

        g_colors_checked = true;
    }
    return g_colors_enabled;
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_checked = true;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

void LogInfo(const std::string& message) {
    Emit("[info]", color::GREEN, message);
}

void LogWarn(const std::string& message) {
    Emit("[warn]", color::BOLD_YELLOW, message);
}

void LogError(const std::string& message) {
    Emit("[error]", color::BOLD_RED, message);
}

}  // namespace neo::cli
