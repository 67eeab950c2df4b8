#pragma once

#include "recdecrypt/metadata.hpp"
#include "recdecrypt/packet.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace recdecrypt {

struct ReplayStats {
    std::uint64_t remote_packets = 0;
    std::uint64_t remote_bytes = 0;
    std::uint64_t skipped_initiator_packets = 0;
};

// "YYYY-MM-DD HH:MM:SS+00" in UTC.
std::string FormatDate(std::uint64_t unix_seconds);

std::string StartBanner(const SessionMetadata& metadata);
std::string EndBanner(const std::optional<ExitData>& exit_data);

// True when the ECHO terminal mode is present with a nonzero value.
bool IsEchoEnabled(const PtyMetadata& pty);

// Rebuilds a script(1) transcript and a scriptreplay(1) timing file from the
// Remote side of the session. Throws NoPtyError when the recording has no
// terminal; decode errors and sink failures propagate.
ReplayStats GenerateReplay(const SessionMetadata& metadata,
                           PacketDecoder& decoder,
                           std::ostream& transcript,
                           std::ostream& timing);

}  // namespace recdecrypt
