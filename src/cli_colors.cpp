#include "recdecrypt/cli_colors.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/env.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace recdecrypt::cli {

namespace {
    bool g_colors_enabled = true;
    bool g_colors_checked = false;
}

bool ColorsEnabled(std::ostream& os) {
    if (!g_colors_checked) {
        // Auto-detect: only color a TTY, and never when disabled from the environment
        bool is_tty = false;
        if (&os == &std::cout) {
            is_tty = isatty(fileno(stdout)) != 0;
        } else if (&os == &std::cerr) {
            is_tty = isatty(fileno(stderr)) != 0;
        }
        g_colors_enabled = is_tty && !recdecrypt::env::IsEnabled(constants::kEnvNoColor);
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

}  // namespace recdecrypt::cli
