#include "recdecrypt/stream_decryptor.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <string>

namespace recdecrypt {

namespace {

std::uint32_t ReadU32Be(const std::uint8_t* ptr) {
    return (static_cast<std::uint32_t>(ptr[0]) << 24)
        | (static_cast<std::uint32_t>(ptr[1]) << 16)
        | (static_cast<std::uint32_t>(ptr[2]) << 8)
        | static_cast<std::uint32_t>(ptr[3]);
}

hpke::Context SetupContext(std::string_view private_key_base64, std::string_view encapsulated_key_hex) {
    hpke::Bytes private_key = hpke::DecodePrivateKey(private_key_base64);
    hpke::Bytes encapsulated_key = hpke::DecodeEncapsulatedKey(encapsulated_key_hex);
    return hpke::SetupBaseReceiver(encapsulated_key, private_key);
}

}  // namespace

StreamDecryptor::StreamDecryptor(std::string_view private_key_base64,
                                 std::string_view encapsulated_key_hex,
                                 ByteSource& ciphertext)
    : context_(SetupContext(private_key_base64, encapsulated_key_hex)),
      ciphertext_(ciphertext) {}

std::size_t StreamDecryptor::DrainPending(std::uint8_t* buffer, std::size_t len) {
    std::size_t available = pending_.size() - pending_offset_;
    std::size_t n = std::min(available, len);
    if (n > 0) {
        std::memcpy(buffer, pending_.data() + pending_offset_, n);
        pending_offset_ += n;
    }
    if (pending_offset_ == pending_.size()) {
        pending_.clear();
        pending_offset_ = 0;
    }
    return n;
}

bool StreamDecryptor::NextChunk(std::vector<std::uint8_t>& plaintext) {
    std::array<std::uint8_t, constants::kLengthPrefixLen> prefix{};
    std::size_t got = ReadFull(ciphertext_, prefix.data(), prefix.size());
    if (got == 0) {
        return false;
    }
    if (got != prefix.size()) {
        throw IOError("truncated chunk length after chunk " + std::to_string(chunks_opened_));
    }
    std::uint32_t chunk_len = ReadU32Be(prefix.data());
    if (chunk_len > constants::kMaxChunkLen) {
        throw IOError("chunk length " + std::to_string(chunk_len) + " exceeds limit");
    }
    std::vector<std::uint8_t> chunk(chunk_len);
    if (ReadFull(ciphertext_, chunk.data(), chunk.size()) != chunk.size()) {
        throw IOError("truncated chunk " + std::to_string(chunks_opened_));
    }
    try {
        plaintext = context_.Open(chunk);
    } catch (const DecryptionError& exc) {
        throw DecryptionError("error decrypting chunk " + std::to_string(chunks_opened_) + ": " + exc.what());
    }
    ++chunks_opened_;
    bytes_decrypted_ += plaintext.size();
    return true;
}

std::size_t StreamDecryptor::Fill(std::uint8_t* buffer, std::size_t len) {
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    std::size_t written = DrainPending(buffer, len);
    std::vector<std::uint8_t> plaintext;
    while (written < len && !exhausted_) {
        try {
            if (!NextChunk(plaintext)) {
                exhausted_ = true;
                break;
            }
        } catch (const std::exception&) {
            failure_ = std::current_exception();
            throw;
        }
        if (plaintext.empty()) {
            continue;
        }
        std::size_t n = std::min(plaintext.size(), len - written);
        std::memcpy(buffer + written, plaintext.data(), n);
        written += n;
        if (n < plaintext.size()) {
            pending_.assign(plaintext.begin() + static_cast<std::ptrdiff_t>(n), plaintext.end());
            pending_offset_ = 0;
        }
        break;
    }
    return written;
}

}  // namespace recdecrypt
