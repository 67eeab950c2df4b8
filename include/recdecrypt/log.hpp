#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace recdecrypt::log {

enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error
};

std::optional<Level> ParseLevel(std::string_view name);

// Reads RECDECRYPT_LOG_LEVEL; unknown values keep the default (info).
void InitFromEnv();
void SetLevel(Level level);
Level CurrentLevel();
bool Enabled(Level level);

void Write(Level level, const std::string& message);

inline void Debug(const std::string& message) { Write(Level::Debug, message); }
inline void Info(const std::string& message) { Write(Level::Info, message); }
inline void Warn(const std::string& message) { Write(Level::Warn, message); }
inline void Error(const std::string& message) { Write(Level::Error, message); }

}  // namespace recdecrypt::log
