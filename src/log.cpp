#include "recdecrypt/log.hpp"

#include "recdecrypt/cli_colors.hpp"
#include "recdecrypt/constants.hpp"
#include "recdecrypt/env.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace recdecrypt::log {

namespace {

Level g_level = Level::Info;

const char* LevelTag(Level level) {
    switch (level) {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warn:
        return "warn";
    case Level::Error:
        return "error";
    }
    return "error";
}

const char* LevelColor(Level level) {
    switch (level) {
    case Level::Debug:
        return cli::color::BRIGHT_BLACK;
    case Level::Info:
        return cli::color::CYAN;
    case Level::Warn:
        return cli::color::YELLOW;
    case Level::Error:
        return cli::color::BOLD_RED;
    }
    return cli::color::RESET;
}

}  // namespace

std::optional<Level> ParseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

void InitFromEnv() {
    std::string raw = recdecrypt::env::Get(constants::kEnvLogLevel);
    if (raw.empty()) {
        return;
    }
    if (auto level = ParseLevel(raw)) {
        g_level = *level;
    }
}

void SetLevel(Level level) {
    g_level = level;
}

Level CurrentLevel() {
    return g_level;
}

bool Enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_level);
}

void Write(Level level, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    std::string tag = std::string("[") + LevelTag(level) + "]";
    std::cerr << cli::Colorize(tag, LevelColor(level)) << " " << message << "\n";
}

}  // namespace recdecrypt::log
