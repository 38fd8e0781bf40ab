#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace vaultsplit::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";
}

// True when `os` is a terminal and VAULTSPLIT_NO_COLOR is not set.
bool ColorsEnabled(std::ostream& os = std::cout);

// Forces colors on or off for every stream (--no-color).
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Red(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::RED, os); }
inline std::string Green(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::GREEN, os); }
inline std::string Yellow(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::YELLOW, os); }
inline std::string Cyan(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::CYAN, os); }

}  // namespace vaultsplit::cli
