#pragma once

#include "recdecrypt/constants.hpp"
#include "recdecrypt/hpke.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace recdecrypt {

// Sender side of the chunked recording format: buffers plaintext and
// writes one length-prefixed HPKE chunk per `chunk_size` bytes.
class StreamEncryptor {
public:
    StreamEncryptor(std::string_view public_key_base64,
                    std::ostream& output,
                    std::size_t chunk_size = constants::kDefaultChunkSize);

    // Hex of the ephemeral public key, as stored in recording metadata.
    const std::string& encapsulated_key_hex() const noexcept { return encapsulated_key_hex_; }

    void Write(const std::uint8_t* data, std::size_t len);
    void Write(const std::vector<std::uint8_t>& data) { Write(data.data(), data.size()); }

    // Seals whatever is buffered and flushes the output.
    void Finish();

    std::uint64_t chunks_written() const noexcept { return chunks_written_; }

private:
    StreamEncryptor(hpke::SenderSetup setup, std::ostream& output, std::size_t chunk_size);

    void SealChunk();

    hpke::Context context_;
    std::string encapsulated_key_hex_;
    std::ostream& output_;
    std::size_t chunk_size_;
    std::vector<std::uint8_t> buffer_;
    bool finished_ = false;
    std::uint64_t chunks_written_ = 0;
};

}  // namespace recdecrypt
