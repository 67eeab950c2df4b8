#include "recdecrypt/byte_source.hpp"

#include "recdecrypt/errors.hpp"

#include <algorithm>
#include <cstring>

namespace recdecrypt {

std::size_t ReadFull(ByteSource& source, std::uint8_t* buffer, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        std::size_t got = source.Fill(buffer + total, len - total);
        if (got == 0) {
            break;
        }
        total += got;
    }
    return total;
}

std::size_t IstreamSource::Fill(std::uint8_t* buffer, std::size_t len) {
    if (len == 0 || input_.eof()) {
        return 0;
    }
    if (!input_) {
        throw IOError("input stream is in a failed state");
    }
    input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(len));
    std::streamsize got = input_.gcount();
    if (input_.bad()) {
        throw IOError("error reading from input stream");
    }
    return static_cast<std::size_t>(got);
}

std::size_t MemorySource::Fill(std::uint8_t* buffer, std::size_t len) {
    std::size_t n = std::min(len, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

}  // namespace recdecrypt
