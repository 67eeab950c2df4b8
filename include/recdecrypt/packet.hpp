#pragma once

#include "recdecrypt/byte_source.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace recdecrypt {

enum class DataSource : std::uint8_t {
    Initiator = 0,
    Remote = 1
};

const char* ToString(DataSource source);

// Microseconds since the session started, as carried on the wire.
using Elapsed = std::chrono::duration<std::uint64_t, std::micro>;

struct DataPacket {
    DataSource source = DataSource::Initiator;
    std::uint32_t code = 0;
    Elapsed elapsed{0};
    std::vector<std::uint8_t> data;
};

// Splits a plaintext byte stream into DataPackets, one frame per Next().
// Next() returns std::nullopt when the stream ends cleanly on a frame
// boundary. A truncated frame throws IOError, a length below the fixed
// header throws FrameTooSmallError and an unknown source tag throws
// UnknownSourceError. The sequence cannot be rewound.
class PacketDecoder {
public:
    explicit PacketDecoder(ByteSource& source) : source_(source) {}

    std::optional<DataPacket> Next();

    std::uint64_t packets_decoded() const noexcept { return packets_decoded_; }

private:
    ByteSource& source_;
    std::vector<std::uint8_t> frame_;
    std::uint64_t packets_decoded_ = 0;
};

// Frame bytes for one packet: length prefix, header and payload.
std::vector<std::uint8_t> EncodePacket(const DataPacket& packet);

}  // namespace recdecrypt
