#include "recdecrypt/packet.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/errors.hpp"

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace recdecrypt {

namespace {

std::uint32_t ReadU32Be(const std::uint8_t* ptr) {
    return (static_cast<std::uint32_t>(ptr[0]) << 24)
        | (static_cast<std::uint32_t>(ptr[1]) << 16)
        | (static_cast<std::uint32_t>(ptr[2]) << 8)
        | static_cast<std::uint32_t>(ptr[3]);
}

std::uint64_t ReadU64Be(const std::uint8_t* ptr) {
    return (static_cast<std::uint64_t>(ReadU32Be(ptr)) << 32) | ReadU32Be(ptr + 4);
}

void AppendU32Be(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void AppendU64Be(std::vector<std::uint8_t>& out, std::uint64_t value) {
    AppendU32Be(out, static_cast<std::uint32_t>(value >> 32));
    AppendU32Be(out, static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
}

}  // namespace

const char* ToString(DataSource source) {
    switch (source) {
    case DataSource::Initiator:
        return "initiator";
    case DataSource::Remote:
        return "remote";
    }
    return "unknown";
}

std::optional<DataPacket> PacketDecoder::Next() {
    std::array<std::uint8_t, constants::kLengthPrefixLen> prefix{};
    std::size_t got = ReadFull(source_, prefix.data(), prefix.size());
    if (got == 0) {
        return std::nullopt;
    }
    if (got != prefix.size()) {
        throw IOError("truncated frame length after packet " + std::to_string(packets_decoded_));
    }
    std::uint32_t total_len = ReadU32Be(prefix.data());
    if (total_len < constants::kFrameHeaderLen) {
        throw FrameTooSmallError("data packet too small: " + std::to_string(total_len) + " bytes");
    }

    frame_.resize(total_len);
    if (ReadFull(source_, frame_.data(), frame_.size()) != frame_.size()) {
        throw IOError("truncated frame for packet " + std::to_string(packets_decoded_));
    }

    DataPacket packet;
    switch (frame_[0]) {
    case constants::kSourceInitiator:
        packet.source = DataSource::Initiator;
        break;
    case constants::kSourceRemote:
        packet.source = DataSource::Remote;
        break;
    default:
        throw UnknownSourceError("unexpected data source " + std::to_string(frame_[0]));
    }
    packet.code = ReadU32Be(frame_.data() + 1);
    packet.elapsed = Elapsed(ReadU64Be(frame_.data() + 5));
    packet.data.assign(frame_.begin() + static_cast<std::ptrdiff_t>(constants::kFrameHeaderLen), frame_.end());
    ++packets_decoded_;
    return packet;
}

std::vector<std::uint8_t> EncodePacket(const DataPacket& packet) {
    std::size_t total = constants::kFrameHeaderLen + packet.data.size();
    if (total > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("data packet too large to frame");
    }
    std::vector<std::uint8_t> out;
    out.reserve(constants::kLengthPrefixLen + total);
    AppendU32Be(out, static_cast<std::uint32_t>(total));
    out.push_back(static_cast<std::uint8_t>(packet.source));
    AppendU32Be(out, packet.code);
    AppendU64Be(out, packet.elapsed.count());
    out.insert(out.end(), packet.data.begin(), packet.data.end());
    return out;
}

}  // namespace recdecrypt
