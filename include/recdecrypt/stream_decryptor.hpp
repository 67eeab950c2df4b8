#pragma once

#include "recdecrypt/byte_source.hpp"
#include "recdecrypt/hpke.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>
#include <vector>

namespace recdecrypt {

// Decrypts a sequence of length-prefixed HPKE chunks and exposes the
// plaintext as a ByteSource. Each chunk is opened in one shot; bytes that
// do not fit the caller's buffer are kept for the next Fill.
//
// Key errors surface from the constructor (KeyDecodeError, KeyFormatError).
// Fill throws IOError on a truncated chunk and DecryptionError on an
// authentication failure. After a failure every later Fill rethrows that
// same error.
class StreamDecryptor : public ByteSource {
public:
    StreamDecryptor(std::string_view private_key_base64,
                    std::string_view encapsulated_key_hex,
                    ByteSource& ciphertext);

    std::size_t Fill(std::uint8_t* buffer, std::size_t len) override;

    std::uint64_t chunks_opened() const noexcept { return chunks_opened_; }
    std::uint64_t bytes_decrypted() const noexcept { return bytes_decrypted_; }

private:
    // Reads and opens the next chunk. Returns false at end of stream.
    bool NextChunk(std::vector<std::uint8_t>& plaintext);
    std::size_t DrainPending(std::uint8_t* buffer, std::size_t len);

    hpke::Context context_;
    ByteSource& ciphertext_;
    std::vector<std::uint8_t> pending_;
    std::size_t pending_offset_ = 0;
    bool exhausted_ = false;
    std::exception_ptr failure_;
    std::uint64_t chunks_opened_ = 0;
    std::uint64_t bytes_decrypted_ = 0;
};

}  // namespace recdecrypt
