#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace neo::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";
}

// Check if colors should be enabled for the given stream
bool ColorsEnabled(std::ostream& os = std::cerr);

// Set whether colors are enabled (can be disabled via --no-color)
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cerr);

inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }

// Diagnostics for the command line tool, one line each on stderr.
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);

}  // namespace neo::cli
