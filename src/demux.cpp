#include "recdecrypt/demux.hpp"

#include "recdecrypt/errors.hpp"

#include <string>

namespace recdecrypt {

DemuxStats DemultiplexRaw(PacketDecoder& decoder, std::ostream& initiator_sink, std::ostream& remote_sink) {
    DemuxStats stats;
    while (auto packet = decoder.Next()) {
        std::ostream* sink = nullptr;
        switch (packet->source) {
        case DataSource::Initiator:
            sink = &initiator_sink;
            stats.initiator_packets += 1;
            stats.initiator_bytes += packet->data.size();
            break;
        case DataSource::Remote:
            sink = &remote_sink;
            stats.remote_packets += 1;
            stats.remote_bytes += packet->data.size();
            break;
        }
        if (!packet->data.empty()) {
            sink->write(reinterpret_cast<const char*>(packet->data.data()),
                        static_cast<std::streamsize>(packet->data.size()));
        }
        if (!*sink) {
            throw IOError(std::string("write error on ") + ToString(packet->source) + " data sink");
        }
    }
    initiator_sink.flush();
    remote_sink.flush();
    if (!initiator_sink || !remote_sink) {
        throw IOError("failed to flush raw data sinks");
    }
    return stats;
}

}  // namespace recdecrypt
