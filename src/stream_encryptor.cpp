#include "recdecrypt/stream_encryptor.hpp"

#include "recdecrypt/encoding.hpp"
#include "recdecrypt/errors.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace recdecrypt {

namespace {

void WriteU32Be(std::uint8_t* out, std::uint32_t value) {
    out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<std::uint8_t>(value & 0xFF);
}

hpke::SenderSetup SetupSender(std::string_view public_key_base64) {
    return hpke::SetupBaseSender(hpke::DecodePublicKey(public_key_base64));
}

}  // namespace

StreamEncryptor::StreamEncryptor(std::string_view public_key_base64,
                                 std::ostream& output,
                                 std::size_t chunk_size)
    : StreamEncryptor(SetupSender(public_key_base64), output, chunk_size) {}

StreamEncryptor::StreamEncryptor(hpke::SenderSetup setup, std::ostream& output, std::size_t chunk_size)
    : context_(std::move(setup.context)),
      encapsulated_key_hex_(encoding::HexEncode(setup.encapsulated_key)),
      output_(output),
      chunk_size_(chunk_size) {
    if (chunk_size_ == 0 || chunk_size_ > constants::kMaxChunkLen - constants::kAeadTagLen) {
        throw std::invalid_argument("chunk size out of range");
    }
    buffer_.reserve(chunk_size_);
}

void StreamEncryptor::Write(const std::uint8_t* data, std::size_t len) {
    if (finished_) {
        throw std::logic_error("StreamEncryptor already finished");
    }
    std::size_t offset = 0;
    while (offset < len) {
        std::size_t take = std::min(chunk_size_ - buffer_.size(), len - offset);
        buffer_.insert(buffer_.end(), data + offset, data + offset + take);
        offset += take;
        if (buffer_.size() == chunk_size_) {
            SealChunk();
        }
    }
}

void StreamEncryptor::SealChunk() {
    if (buffer_.empty()) {
        return;
    }
    std::vector<std::uint8_t> sealed = context_.Seal(buffer_);
    std::array<std::uint8_t, constants::kLengthPrefixLen> prefix{};
    WriteU32Be(prefix.data(), static_cast<std::uint32_t>(sealed.size()));
    output_.write(reinterpret_cast<const char*>(prefix.data()), static_cast<std::streamsize>(prefix.size()));
    output_.write(reinterpret_cast<const char*>(sealed.data()), static_cast<std::streamsize>(sealed.size()));
    if (!output_) {
        throw IOError("failed to write encrypted chunk");
    }
    buffer_.clear();
    ++chunks_written_;
}

void StreamEncryptor::Finish() {
    if (finished_) {
        return;
    }
    SealChunk();
    output_.flush();
    if (!output_) {
        throw IOError("failed to flush encrypted output");
    }
    finished_ = true;
}

}  // namespace recdecrypt
