#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "recdecrypt/env.hpp"

namespace recdecrypt::constants {

inline constexpr std::size_t kLengthPrefixLen = 4;

// source (1) + code (4) + elapsed micros (8)
inline constexpr std::size_t kFrameHeaderLen = 13;
inline constexpr std::uint8_t kSourceInitiator = 0;
inline constexpr std::uint8_t kSourceRemote = 1;

inline constexpr std::size_t kX25519KeyLen = 32;
inline constexpr std::size_t kAeadKeyLen = 32;
inline constexpr std::size_t kAeadNonceLen = 12;
inline constexpr std::size_t kAeadTagLen = 16;
inline constexpr std::size_t kHashLen = 32;

inline constexpr std::uint16_t kKemX25519HkdfSha256 = 0x0020;
inline constexpr std::uint16_t kKdfHkdfSha256 = 0x0001;
inline constexpr std::uint16_t kAeadChaCha20Poly1305 = 0x0003;
inline constexpr std::uint8_t kHpkeModeBase = 0x00;
inline constexpr std::string_view kHpkeVersionLabel = "HPKE-v1";

// Upper bound accepted for a single chunk or frame length prefix.
inline constexpr std::uint32_t kMaxChunkLen = 64u * 1024u * 1024u;
inline constexpr std::uint32_t kMaxMetadataLen = 16u * 1024u * 1024u;
inline constexpr std::size_t kDefaultChunkSize = 32u * 1024u;

inline constexpr std::string_view kClientDataFileName = "data_from_client.txt";
inline constexpr std::string_view kServerDataFileName = "data_from_server.txt";
inline constexpr std::string_view kReplayDataFileName = "term_data.txt";
inline constexpr std::string_view kReplayTimesFileName = "term_times.txt";
inline constexpr std::string_view kPublicKeySuffix = ".pub";
inline constexpr std::string_view kDecryptedSuffix = "-decrypted";
inline constexpr std::string_view kZipExt = ".zip";
inline constexpr std::string_view kTgzExt = ".tgz";
inline constexpr std::string_view kTxzExt = ".txz";

inline constexpr std::string_view kPtyModeEcho = "ECHO";
inline constexpr std::string_view kUnknownTerm = "unknown";
inline constexpr std::string_view kDefaultReplayProgram = "scriptreplay";

inline constexpr std::string_view kEnvPrivateKeyFile = "RECDECRYPT_PRIVATE_KEY_FILE";
inline constexpr std::string_view kEnvScriptReplay = "RECDECRYPT_SCRIPTREPLAY";
inline constexpr std::string_view kEnvLogLevel = "RECDECRYPT_LOG_LEVEL";
inline constexpr std::string_view kEnvNoColor = "RECDECRYPT_NO_COLOR";
inline constexpr std::string_view kEnvChunkSize = "RECDECRYPT_CHUNK_SIZE";

inline std::size_t WriterChunkSize() {
    std::string raw = recdecrypt::env::Get(kEnvChunkSize);
    if (raw.empty()) {
        return kDefaultChunkSize;
    }
    try {
        std::uint64_t parsed = static_cast<std::uint64_t>(std::stoull(raw));
        if (parsed == 0) {
            return kDefaultChunkSize;
        }
        if (parsed > kMaxChunkLen - kAeadTagLen) {
            return kMaxChunkLen - kAeadTagLen;
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        return kDefaultChunkSize;
    }
}

inline std::string ReplayProgram() {
    return recdecrypt::env::GetOr(kEnvScriptReplay, kDefaultReplayProgram);
}

}  // namespace recdecrypt::constants
