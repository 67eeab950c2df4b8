#include "recdecrypt/replay.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/errors.hpp"
#include "recdecrypt/log.hpp"

#include <cstdio>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>

namespace recdecrypt {

namespace {

void WriteOrThrow(std::ostream& out, const char* data, std::size_t len, const char* what) {
    out.write(data, static_cast<std::streamsize>(len));
    if (!out) {
        throw IOError(std::string("could not write ") + what);
    }
}

void WriteOrThrow(std::ostream& out, const std::string& text, const char* what) {
    WriteOrThrow(out, text.data(), text.size(), what);
}

}  // namespace

std::string FormatDate(std::uint64_t unix_seconds) {
    if (unix_seconds > static_cast<std::uint64_t>(std::numeric_limits<std::time_t>::max())) {
        throw std::runtime_error("timestamp out of range: " + std::to_string(unix_seconds));
    }
    std::time_t tt = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    if (!gmtime_r(&tt, &tm)) {
        throw std::runtime_error("timestamp out of range: " + std::to_string(unix_seconds));
    }
    char buffer[64];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S+00", &tm) == 0) {
        throw std::runtime_error("could not format timestamp");
    }
    return std::string(buffer);
}

std::string StartBanner(const SessionMetadata& metadata) {
    if (!metadata.pty) {
        throw NoPtyError("session has no PTY allocated");
    }
    const PtyMetadata& pty = *metadata.pty;
    return "Session started on " + FormatDate(metadata.started_at)
           + " [TERM=\"" + pty.term.value_or(std::string(constants::kUnknownTerm))
           + "\" COLUMNS=\"" + std::to_string(pty.width)
           + "\" LINES=\"" + std::to_string(pty.height) + "\"]\n";
}

std::string EndBanner(const std::optional<ExitData>& exit_data) {
    if (!exit_data) {
        return "\nSession has no termination data\n";
    }
    std::string end = FormatDate(exit_data->timestamp);
    if (exit_data->error_msg) {
        return "\nScript done on " + end + " [ERROR=\"" + *exit_data->error_msg + "\"]\n";
    }
    if (exit_data->core_dumped) {
        return "\nScript done on " + end + " [CORE DUMPED]\n";
    }
    return "\nScript done on " + end + " [COMMAND_EXIT_CODE=\""
           + std::to_string(exit_data->status.value_or(0)) + "\"]\n";
}

bool IsEchoEnabled(const PtyMetadata& pty) {
    for (const auto& mode : pty.modes) {
        if (mode.first == constants::kPtyModeEcho && mode.second != 0) {
            return true;
        }
    }
    return false;
}

ReplayStats GenerateReplay(const SessionMetadata& metadata,
                           PacketDecoder& decoder,
                           std::ostream& transcript,
                           std::ostream& timing) {
    WriteOrThrow(transcript, StartBanner(metadata), "transcript");
    // Not used for rendering yet; the transcript is the Remote echo.
    const bool echo_enabled = IsEchoEnabled(*metadata.pty);
    log::Debug(std::string("terminal echo ") + (echo_enabled ? "enabled" : "disabled"));

    ReplayStats stats;
    Elapsed previous{0};
    while (std::optional<DataPacket> packet = decoder.Next()) {
        if (packet->source == DataSource::Initiator) {
            // The remote side echoes initiator input back.
            ++stats.skipped_initiator_packets;
            continue;
        }
        WriteOrThrow(transcript,
                     reinterpret_cast<const char*>(packet->data.data()),
                     packet->data.size(),
                     "transcript");

        Elapsed delta{0};
        if (packet->elapsed >= previous) {
            delta = packet->elapsed - previous;
        } else {
            log::Warn("remote elapsed time went backwards at packet "
                      + std::to_string(decoder.packets_decoded()));
        }
        char line[64];
        int n = std::snprintf(line,
                              sizeof(line),
                              "%.6f %zu\n",
                              static_cast<double>(delta.count()) / 1e6,
                              packet->data.size());
        if (n < 0 || static_cast<std::size_t>(n) >= sizeof(line)) {
            throw std::runtime_error("could not format timing line");
        }
        WriteOrThrow(timing, line, static_cast<std::size_t>(n), "timing");
        previous = packet->elapsed;

        ++stats.remote_packets;
        stats.remote_bytes += packet->data.size();
    }

    WriteOrThrow(transcript, EndBanner(metadata.exit_data), "transcript");
    transcript.flush();
    timing.flush();
    if (!transcript || !timing) {
        throw IOError("could not flush replay output");
    }
    return stats;
}

}  // namespace recdecrypt
