#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace recdecrypt {

struct PtyMetadata {
    std::optional<std::string> term;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    // Terminal modes in the order the agent reported them.
    std::vector<std::pair<std::string, std::uint32_t>> modes;
};

struct ExitData {
    std::uint64_t timestamp = 0;
    std::optional<std::uint32_t> status;
    std::optional<std::string> signal;
    bool core_dumped = false;
    std::optional<std::string> error_msg;
};

struct SessionMetadata {
    std::uint64_t started_at = 0;
    std::uint64_t data_size = 0;
    std::string encapsulated_key;
    std::optional<PtyMetadata> pty;
    std::optional<ExitData> exit_data;
};

// Reads the length-prefixed base64 JSON header at the start of a recording
// and leaves `input` positioned on the first ciphertext chunk. Any failure
// throws MetadataError.
SessionMetadata ReadMetadata(std::istream& input);

// Header bytes (length prefix included) for `metadata`.
std::vector<std::uint8_t> EncodeMetadata(const SessionMetadata& metadata);

std::string MetadataToJson(const SessionMetadata& metadata);
SessionMetadata MetadataFromJson(const std::string& text);

// Human readable multi-line summary used by the info command.
std::string FormatMetadata(const SessionMetadata& metadata);

}  // namespace recdecrypt
