#pragma once

#include "recdecrypt/packet.hpp"

#include <cstdint>
#include <ostream>

namespace recdecrypt {

struct DemuxStats {
    std::uint64_t initiator_packets = 0;
    std::uint64_t initiator_bytes = 0;
    std::uint64_t remote_packets = 0;
    std::uint64_t remote_bytes = 0;
};

// Drains `decoder`, writing each payload to the sink of its side in
// arrival order. Decode errors propagate; a failed sink write throws IOError.
DemuxStats DemultiplexRaw(PacketDecoder& decoder, std::ostream& initiator_sink, std::ostream& remote_sink);

}  // namespace recdecrypt
