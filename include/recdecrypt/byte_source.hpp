#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <utility>
#include <vector>

namespace recdecrypt {

// Pull-based byte stream. Fill writes up to `len` bytes into `buffer` and
// returns how many were written; 0 means the stream is exhausted (never
// returned for len > 0 while data remains). Failures are thrown.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual std::size_t Fill(std::uint8_t* buffer, std::size_t len) = 0;
};

// Reads until `len` bytes are collected or the source is exhausted.
// Returns the number of bytes read.
std::size_t ReadFull(ByteSource& source, std::uint8_t* buffer, std::size_t len);

class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& input) : input_(input) {}

    std::size_t Fill(std::uint8_t* buffer, std::size_t len) override;

private:
    std::istream& input_;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    std::size_t Fill(std::uint8_t* buffer, std::size_t len) override;

    std::size_t remaining() const noexcept { return data_.size() - offset_; }

private:
    std::vector<std::uint8_t> data_;
    std::size_t offset_ = 0;
};

}  // namespace recdecrypt
