#pragma once

#include "recdecrypt/constants.hpp"
#include "recdecrypt/demux.hpp"
#include "recdecrypt/hpke.hpp"
#include "recdecrypt/metadata.hpp"
#include "recdecrypt/packet.hpp"
#include "recdecrypt/replay.hpp"
#include "recdecrypt/stream_encryptor.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace recdecrypt {

// Key text from a file, surrounding whitespace removed. Throws IOError.
std::string ReadKeyFile(const std::filesystem::path& path);

// Writes a fresh key pair: the private key to `private_path` (owner
// read/write only) and the public key to `private_path + ".pub"`.
hpke::KeyPair WriteKeyPair(const std::filesystem::path& private_path);

std::filesystem::path PublicKeyPath(const std::filesystem::path& private_path);

// Produces a recording file: metadata header followed by HPKE chunks
// carrying encoded packet frames. The metadata's encapsulated key is
// filled in from the fresh sender context.
class RecordingWriter {
public:
    RecordingWriter(std::ostream& output,
                    std::string_view public_key_base64,
                    SessionMetadata metadata,
                    std::size_t chunk_size = constants::WriterChunkSize());

    void WritePacket(const DataPacket& packet);
    void Finish();

    const SessionMetadata& metadata() const noexcept { return metadata_; }
    std::uint64_t packets_written() const noexcept { return packets_written_; }

private:
    StreamEncryptor encryptor_;
    SessionMetadata metadata_;
    std::uint64_t packets_written_ = 0;
};

struct SessionSummary {
    SessionMetadata metadata;
    std::uint64_t chunks_opened = 0;
    std::uint64_t bytes_decrypted = 0;
    std::optional<ReplayStats> replay;
    std::optional<DemuxStats> raw;

    bool has_pty() const noexcept { return metadata.pty.has_value(); }
};

// Decrypts `recording` (positioned at the metadata header) into `dir`:
// term_data.txt/term_times.txt for PTY sessions, data_from_client.txt and
// data_from_server.txt otherwise.
SessionSummary DecryptToDirectory(std::istream& recording,
                                  std::string_view private_key_base64,
                                  const std::filesystem::path& dir);

struct DecryptOptions {
    std::filesystem::path input;
    std::filesystem::path private_key_file;
    bool replay = false;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> output_dir;
    bool compress = false;
};

struct DecryptResult {
    SessionSummary summary;
    // Archive or output directory; empty after a replay.
    std::filesystem::path destination;
};

DecryptResult DecryptRecording(const DecryptOptions& options);

// Runs the replay program on a transcript/timing pair and waits for it.
void RunReplay(const std::filesystem::path& transcript, const std::filesystem::path& timing);

}  // namespace recdecrypt
