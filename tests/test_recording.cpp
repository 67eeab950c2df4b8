#include <gtest/gtest.h>

#include "recdecrypt/archive.hpp"
#include "recdecrypt/constants.hpp"
#include "recdecrypt/errors.hpp"
#include "recdecrypt/recording.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include <sys/stat.h>

namespace fs = std::filesystem;
using recdecrypt::DataPacket;
using recdecrypt::DataSource;
using recdecrypt::RecordingWriter;
using recdecrypt::SessionMetadata;

namespace {

std::string Slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

DataPacket Packet(DataSource source, std::uint64_t micros, const std::string& data) {
    DataPacket packet;
    packet.source = source;
    packet.elapsed = recdecrypt::Elapsed(micros);
    packet.data.assign(data.begin(), data.end());
    return packet;
}

SessionMetadata PtySession() {
    SessionMetadata meta;
    meta.started_at = 0;
    recdecrypt::PtyMetadata pty;
    pty.term = "xterm";
    pty.width = 80;
    pty.height = 24;
    pty.modes = {{"ECHO", 1}};
    meta.pty = pty;
    recdecrypt::ExitData exit;
    exit.timestamp = 100;
    exit.status = 1;
    meta.exit_data = exit;
    return meta;
}

class RecordingTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = recdecrypt::archive::CreateTempDir("recdecrypt-test-rec");
        key_path_ = dir_ / "recorder.key";
        keys_ = recdecrypt::WriteKeyPair(key_path_);
    }

    void TearDown() override {
        unsetenv(std::string(recdecrypt::constants::kEnvScriptReplay).c_str());
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path WriteRecording(const std::string& name, const SessionMetadata& meta, std::size_t chunk_size) {
        fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        RecordingWriter writer(out, keys_.public_key, meta, chunk_size);
        writer.WritePacket(Packet(DataSource::Remote, 0, "ab"));
        writer.WritePacket(Packet(DataSource::Initiator, 500000, "xy"));
        writer.WritePacket(Packet(DataSource::Remote, 1500000, "cd"));
        writer.Finish();
        EXPECT_EQ(writer.packets_written(), 3u);
        EXPECT_EQ(writer.metadata().encapsulated_key.size(), 64u);
        return path;
    }

    fs::path dir_;
    fs::path key_path_;
    recdecrypt::hpke::KeyPair keys_;
};

TEST_F(RecordingTest, KeyFilesAreWrittenWithRestrictedPrivateKey) {
    EXPECT_EQ(recdecrypt::ReadKeyFile(key_path_), keys_.private_key);
    EXPECT_EQ(recdecrypt::ReadKeyFile(recdecrypt::PublicKeyPath(key_path_)), keys_.public_key);
    EXPECT_EQ(recdecrypt::PublicKeyPath(key_path_).filename(), fs::path("recorder.key.pub"));
    struct stat st {};
    ASSERT_EQ(::stat(key_path_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(RecordingTest, KeyFileWhitespaceIsTrimmed) {
    fs::path padded = dir_ / "padded.key";
    std::ofstream(padded) << "\n  " << keys_.private_key << "  \r\n";
    EXPECT_EQ(recdecrypt::ReadKeyFile(padded), keys_.private_key);
    EXPECT_THROW(recdecrypt::ReadKeyFile(dir_ / "missing.key"), recdecrypt::IOError);
}

TEST_F(RecordingTest, PtySessionDecryptsToTranscript) {
    for (std::size_t chunk_size : {1u, 5u, 4096u}) {
        fs::path recording = WriteRecording("pty.rec", PtySession(), chunk_size);
        fs::path out = dir_ / ("pty-out-" + std::to_string(chunk_size));
        fs::create_directories(out);
        std::ifstream in(recording, std::ios::binary);
        recdecrypt::SessionSummary summary = recdecrypt::DecryptToDirectory(in, keys_.private_key, out);
        ASSERT_TRUE(summary.replay.has_value());
        EXPECT_FALSE(summary.raw.has_value());
        EXPECT_EQ(summary.replay->remote_packets, 2u);
        EXPECT_EQ(Slurp(out / "term_data.txt"),
                  "Session started on 1970-01-01 00:00:00+00 [TERM=\"xterm\" COLUMNS=\"80\" LINES=\"24\"]\n"
                  "abcd"
                  "\nScript done on 1970-01-01 00:01:40+00 [COMMAND_EXIT_CODE=\"1\"]\n");
        EXPECT_EQ(Slurp(out / "term_times.txt"), "0.000000 2\n1.500000 2\n");
    }
}

TEST_F(RecordingTest, RawSessionDemultiplexes) {
    SessionMetadata meta;
    meta.started_at = 10;
    fs::path recording = WriteRecording("raw.rec", meta, 4096);
    fs::path out = dir_ / "raw-out";
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = key_path_;
    options.output_dir = out;
    recdecrypt::DecryptResult result = recdecrypt::DecryptRecording(options);
    EXPECT_EQ(result.destination, out);
    ASSERT_TRUE(result.summary.raw.has_value());
    EXPECT_EQ(Slurp(out / "data_from_client.txt"), "xy");
    EXPECT_EQ(Slurp(out / "data_from_server.txt"), "abcd");
    EXPECT_GT(result.summary.chunks_opened, 0u);
}

TEST_F(RecordingTest, DefaultOutputIsArchiveNextToInput) {
    fs::path recording = WriteRecording("archived.rec", PtySession(), 4096);
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = key_path_;
    recdecrypt::DecryptResult result = recdecrypt::DecryptRecording(options);
    EXPECT_EQ(result.destination, dir_ / "archived.rec-decrypted.zip");
    EXPECT_TRUE(fs::is_regular_file(result.destination));
    EXPECT_EQ(Slurp(result.destination).substr(0, 4), std::string("PK\x03\x04"));
}

TEST_F(RecordingTest, BadArchiveNameFailsBeforeDecrypting) {
    fs::path recording = WriteRecording("named.rec", PtySession(), 4096);
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = key_path_;
    options.output = dir_ / "out.rar";
    EXPECT_THROW(recdecrypt::DecryptRecording(options), recdecrypt::ArchiveError);
    EXPECT_FALSE(fs::exists(dir_ / "out.rar"));
}

TEST_F(RecordingTest, ReplayOfRawSessionIsRejected) {
    fs::path recording = WriteRecording("raw-replay.rec", SessionMetadata{}, 4096);
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = key_path_;
    options.replay = true;
    EXPECT_THROW(recdecrypt::DecryptRecording(options), recdecrypt::NoPtyError);
}

TEST_F(RecordingTest, ReplayRunsConfiguredProgram) {
    fs::path recording = WriteRecording("replay.rec", PtySession(), 4096);
    setenv(std::string(recdecrypt::constants::kEnvScriptReplay).c_str(), "true", 1);
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = key_path_;
    options.replay = true;
    recdecrypt::DecryptResult result = recdecrypt::DecryptRecording(options);
    EXPECT_TRUE(result.destination.empty());
    EXPECT_TRUE(result.summary.replay.has_value());
}

TEST_F(RecordingTest, MissingReplayProgramIsReported) {
    fs::path recording = WriteRecording("replay-missing.rec", PtySession(), 4096);
    setenv(std::string(recdecrypt::constants::kEnvScriptReplay).c_str(), "recdecrypt-no-such-program", 1);
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = key_path_;
    options.replay = true;
    EXPECT_THROW(recdecrypt::DecryptRecording(options), recdecrypt::Error);
}

TEST_F(RecordingTest, ReplayProgramExiting127IsNotALaunchFailure) {
    fs::path recording = WriteRecording("replay-127.rec", PtySession(), 4096);
    fs::path program = dir_ / "replay-exit-127.sh";
    {
        std::ofstream script(program);
        script << "#!/bin/sh\nexit 127\n";
    }
    fs::permissions(program, fs::perms::owner_all);
    setenv(std::string(recdecrypt::constants::kEnvScriptReplay).c_str(), program.c_str(), 1);
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = key_path_;
    options.replay = true;
    recdecrypt::DecryptResult result;
    EXPECT_NO_THROW(result = recdecrypt::DecryptRecording(options));
    EXPECT_TRUE(result.summary.replay.has_value());
}

TEST_F(RecordingTest, WrongKeyIsADecryptionError) {
    fs::path recording = WriteRecording("wrong.rec", PtySession(), 4096);
    fs::path other_key = dir_ / "other.key";
    recdecrypt::WriteKeyPair(other_key);
    recdecrypt::DecryptOptions options;
    options.input = recording;
    options.private_key_file = other_key;
    options.output_dir = dir_ / "wrong-out";
    EXPECT_THROW(recdecrypt::DecryptRecording(options), recdecrypt::DecryptionError);
}

TEST_F(RecordingTest, MissingInputIsAnIoError) {
    recdecrypt::DecryptOptions options;
    options.input = dir_ / "absent.rec";
    options.private_key_file = key_path_;
    options.output_dir = dir_ / "absent-out";
    EXPECT_THROW(recdecrypt::DecryptRecording(options), recdecrypt::IOError);
}

}  // namespace
