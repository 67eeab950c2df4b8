#include "recdecrypt/recording.hpp"

#include "recdecrypt/archive.hpp"
#include "recdecrypt/byte_source.hpp"
#include "recdecrypt/encoding.hpp"
#include "recdecrypt/errors.hpp"
#include "recdecrypt/log.hpp"
#include "recdecrypt/stream_decryptor.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace recdecrypt {

namespace {

void WriteTextFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw IOError("could not create key file: " + path.string());
    }
    output.write(text.data(), static_cast<std::streamsize>(text.size()));
    output.flush();
    if (!output) {
        throw IOError("could not write key file: " + path.string());
    }
}

void SetPermissions(const std::filesystem::path& path, std::filesystem::perms perms) {
    std::error_code ec;
    std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace, ec);
    if (ec) {
        log::Warn("could not set permissions on " + path.string() + ": " + ec.message());
    }
}

std::ofstream OpenArtifact(const std::filesystem::path& path) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw IOError("could not create output file: " + path.string());
    }
    return output;
}

}  // namespace

std::string ReadKeyFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IOError("failed to open key file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw IOError("failed to read key file: " + path.string());
    }
    return std::string(encoding::Trim(text));
}

std::filesystem::path PublicKeyPath(const std::filesystem::path& private_path) {
    std::filesystem::path out = private_path;
    out += constants::kPublicKeySuffix;
    return out;
}

hpke::KeyPair WriteKeyPair(const std::filesystem::path& private_path) {
    hpke::KeyPair pair = hpke::GenerateKeyPair();
    if (private_path.has_parent_path()) {
        std::filesystem::create_directories(private_path.parent_path());
    }
    // Restrict before the secret lands in the file.
    WriteTextFile(private_path, std::string());
    SetPermissions(private_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    WriteTextFile(private_path, pair.private_key);

    auto public_path = PublicKeyPath(private_path);
    WriteTextFile(public_path, pair.public_key);
    SetPermissions(public_path,
                   std::filesystem::perms::owner_read | std::filesystem::perms::owner_write
                       | std::filesystem::perms::group_read | std::filesystem::perms::others_read);
    log::Debug("wrote key pair " + private_path.string() + " / " + public_path.string());
    return pair;
}

RecordingWriter::RecordingWriter(std::ostream& output,
                                 std::string_view public_key_base64,
                                 SessionMetadata metadata,
                                 std::size_t chunk_size)
    : encryptor_(public_key_base64, output, chunk_size),
      metadata_(std::move(metadata)) {
    metadata_.encapsulated_key = encryptor_.encapsulated_key_hex();
    std::vector<std::uint8_t> header = EncodeMetadata(metadata_);
    output.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (!output) {
        throw IOError("could not write recording metadata");
    }
}

void RecordingWriter::WritePacket(const DataPacket& packet) {
    encryptor_.Write(EncodePacket(packet));
    ++packets_written_;
}

void RecordingWriter::Finish() {
    encryptor_.Finish();
}

SessionSummary DecryptToDirectory(std::istream& recording,
                                  std::string_view private_key_base64,
                                  const std::filesystem::path& dir) {
    SessionSummary summary;
    summary.metadata = ReadMetadata(recording);
    const SessionMetadata& meta = summary.metadata;
    log::Debug("session started at " + FormatDate(meta.started_at) + ", "
               + (meta.pty ? "pty" : "raw") + " session");

    IstreamSource ciphertext(recording);
    StreamDecryptor decryptor(private_key_base64, meta.encapsulated_key, ciphertext);
    PacketDecoder decoder(decryptor);

    if (meta.pty) {
        std::ofstream transcript = OpenArtifact(dir / constants::kReplayDataFileName);
        std::ofstream timing = OpenArtifact(dir / constants::kReplayTimesFileName);
        summary.replay = GenerateReplay(meta, decoder, transcript, timing);
        log::Debug("replay: " + std::to_string(summary.replay->remote_packets) + " remote packet(s), "
                   + std::to_string(summary.replay->skipped_initiator_packets) + " initiator packet(s) skipped");
    } else {
        std::ofstream client = OpenArtifact(dir / constants::kClientDataFileName);
        std::ofstream server = OpenArtifact(dir / constants::kServerDataFileName);
        summary.raw = DemultiplexRaw(decoder, client, server);
        log::Debug("raw: " + std::to_string(summary.raw->initiator_packets) + " initiator packet(s), "
                   + std::to_string(summary.raw->remote_packets) + " remote packet(s)");
    }
    summary.chunks_opened = decryptor.chunks_opened();
    summary.bytes_decrypted = decryptor.bytes_decrypted();
    return summary;
}

void RunReplay(const std::filesystem::path& transcript, const std::filesystem::path& timing) {
    std::string program = constants::ReplayProgram();
    std::string timing_arg = timing.string();
    std::string transcript_arg = transcript.string();
    std::vector<const char*> argv{program.c_str(), "--timing", timing_arg.c_str(), transcript_arg.c_str(), nullptr};

    log::Debug("launching " + program);
    // The child reports a failed execvp through this pipe; a successful exec
    // closes the write end without writing.
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }
    if (pid == 0) {
        close(pipefd[0]);
        execvp(program.c_str(), const_cast<char**>(argv.data()));
        int err = errno;
        ssize_t written = write(pipefd[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }
    close(pipefd[1]);
    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = read(pipefd[0], &exec_errno, sizeof(exec_errno));
    } while (got == -1 && errno == EINTR);
    close(pipefd[0]);

    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        throw Error("could not launch " + program + " (" + std::strerror(exec_errno)
                    + "), make sure it is in your PATH");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        log::Warn(program + " exited with status " + std::to_string(WEXITSTATUS(status)));
    } else if (!WIFEXITED(status)) {
        log::Warn(program + " did not exit cleanly");
    }
}

DecryptResult DecryptRecording(const DecryptOptions& options) {
    if (options.replay && (options.output || options.output_dir)) {
        throw std::invalid_argument("replay cannot be combined with an output file or directory");
    }
    std::optional<std::pair<std::filesystem::path, archive::PackMode>> target;
    if (!options.replay && !options.output_dir) {
        // Validate the archive name before doing any work.
        target = archive::ResolveArchivePath(options.input, options.output, options.compress);
    }

    std::ifstream recording(options.input, std::ios::binary);
    if (!recording) {
        throw IOError("could not open input file: " + options.input.string());
    }
    std::string private_key = ReadKeyFile(options.private_key_file);

    DecryptResult result;
    if (options.output_dir) {
        std::filesystem::create_directories(*options.output_dir);
        result.summary = DecryptToDirectory(recording, private_key, *options.output_dir);
        result.destination = *options.output_dir;
        return result;
    }

    archive::TempDir work("recdecrypt");
    if (options.replay) {
        // Fail before decrypting anything when there is nothing to replay.
        std::streampos start = recording.tellg();
        SessionMetadata meta = ReadMetadata(recording);
        if (!meta.pty) {
            throw NoPtyError("session has no PTY allocated, cannot replay");
        }
        recording.seekg(start);
        if (!recording) {
            throw IOError("could not rewind input file: " + options.input.string());
        }
    }
    result.summary = DecryptToDirectory(recording, private_key, work.path());

    if (options.replay) {
        RunReplay(work.path() / constants::kReplayDataFileName, work.path() / constants::kReplayTimesFileName);
        return result;
    }
    archive::PackDirectory(work.path(), target->first, target->second);
    result.destination = target->first;
    return result;
}

}  // namespace recdecrypt
