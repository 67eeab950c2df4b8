#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace recdecrypt::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// Check if colors should be enabled for the given stream
bool ColorsEnabled(std::ostream& os = std::cerr);

// Set whether colors are enabled (--no-color, RECDECRYPT_NO_COLOR)
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cerr);

inline std::string Red(const std::string& text) { return Colorize(text, color::RED); }

}  // namespace recdecrypt::cli
