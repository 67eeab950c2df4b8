#include <gtest/gtest.h>

#include "recdecrypt/encoding.hpp"
#include "recdecrypt/errors.hpp"
#include "recdecrypt/metadata.hpp"

#include <sstream>
#include <string>
#include <vector>

using recdecrypt::MetadataError;
using recdecrypt::SessionMetadata;

namespace {

std::string Header(const std::string& base64_body) {
    std::uint32_t len = static_cast<std::uint32_t>(base64_body.size());
    std::string out;
    out.push_back(static_cast<char>(len >> 24));
    out.push_back(static_cast<char>(len >> 16));
    out.push_back(static_cast<char>(len >> 8));
    out.push_back(static_cast<char>(len));
    return out + base64_body;
}

std::string JsonHeader(const std::string& json) {
    return Header(recdecrypt::encoding::Base64Encode(std::vector<std::uint8_t>(json.begin(), json.end())));
}

SessionMetadata ReadFrom(const std::string& bytes) {
    std::istringstream input(bytes);
    return recdecrypt::ReadMetadata(input);
}

TEST(MetadataTest, ReadsFullDocument) {
    std::string json = R"({
        "started_at": 1700000000,
        "data_size": 4096,
        "encapsulated_key": "00ff",
        "pty": {"term": "xterm-256color", "width": 120, "height": 40,
                "modes": [["ECHO", 1], ["ICANON", 0]]},
        "exit_data": {"timestamp": 1700000100, "status": 2, "signal": "SIGTERM",
                      "core_dumped": true, "error_msg": "lost"}
    })";
    SessionMetadata meta = ReadFrom(JsonHeader(json));
    EXPECT_EQ(meta.started_at, 1700000000u);
    EXPECT_EQ(meta.data_size, 4096u);
    EXPECT_EQ(meta.encapsulated_key, "00ff");
    ASSERT_TRUE(meta.pty.has_value());
    EXPECT_EQ(meta.pty->term, "xterm-256color");
    EXPECT_EQ(meta.pty->width, 120u);
    EXPECT_EQ(meta.pty->height, 40u);
    ASSERT_EQ(meta.pty->modes.size(), 2u);
    EXPECT_EQ(meta.pty->modes[0].first, "ECHO");
    EXPECT_EQ(meta.pty->modes[0].second, 1u);
    ASSERT_TRUE(meta.exit_data.has_value());
    EXPECT_EQ(meta.exit_data->timestamp, 1700000100u);
    EXPECT_EQ(meta.exit_data->status, 2u);
    EXPECT_EQ(meta.exit_data->signal, "SIGTERM");
    EXPECT_TRUE(meta.exit_data->core_dumped);
    EXPECT_EQ(meta.exit_data->error_msg, "lost");
}

TEST(MetadataTest, OptionalFieldsMayBeNullOrAbsent) {
    SessionMetadata meta = ReadFrom(JsonHeader(
        R"({"started_at": 5, "encapsulated_key": "ab", "pty": null,
            "exit_data": {"timestamp": 9, "status": null}})"));
    EXPECT_EQ(meta.data_size, 0u);
    EXPECT_FALSE(meta.pty.has_value());
    ASSERT_TRUE(meta.exit_data.has_value());
    EXPECT_FALSE(meta.exit_data->status.has_value());
    EXPECT_FALSE(meta.exit_data->core_dumped);
    EXPECT_FALSE(meta.exit_data->error_msg.has_value());
}

TEST(MetadataTest, LeavesStreamAtFirstChunk) {
    std::string bytes = JsonHeader(R"({"started_at": 1, "encapsulated_key": "ab"})") + "TAIL";
    std::istringstream input(bytes);
    recdecrypt::ReadMetadata(input);
    std::string rest;
    input >> rest;
    EXPECT_EQ(rest, "TAIL");
}

TEST(MetadataTest, RejectsBrokenHeaders) {
    EXPECT_THROW(ReadFrom(""), MetadataError);
    EXPECT_THROW(ReadFrom(std::string("\x00\x00", 2)), MetadataError);
    EXPECT_THROW(ReadFrom(std::string("\x00\x00\x00\x10", 4) + "abc"), MetadataError);
    EXPECT_THROW(ReadFrom(Header("not base64!")), MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader("{")), MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader("[]")), MetadataError);
}

TEST(MetadataTest, RejectsMissingOrMistypedFields) {
    EXPECT_THROW(ReadFrom(JsonHeader(R"({"encapsulated_key": "ab"})")), MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader(R"({"started_at": 1})")), MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader(R"({"started_at": "1", "encapsulated_key": "ab"})")), MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader(R"({"started_at": 1, "encapsulated_key": "ab",
                                         "pty": {"width": 1, "height": 1}})")),
                 MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader(R"({"started_at": 1, "encapsulated_key": "ab",
                                         "pty": {"width": 4294967296, "height": 1, "modes": []}})")),
                 MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader(R"({"started_at": 1, "encapsulated_key": "ab",
                                         "pty": {"width": 1, "height": 1, "modes": [["ECHO"]]}})")),
                 MetadataError);
    EXPECT_THROW(ReadFrom(JsonHeader(R"({"started_at": 1, "encapsulated_key": "ab",
                                         "exit_data": {"status": 1}})")),
                 MetadataError);
}

TEST(MetadataTest, EncodeThenReadPreservesFields) {
    SessionMetadata meta;
    meta.started_at = 42;
    meta.data_size = 7;
    meta.encapsulated_key = "deadbeef";
    recdecrypt::PtyMetadata pty;
    pty.width = 80;
    pty.height = 25;
    pty.modes = {{"ECHO", 1}};
    meta.pty = pty;
    recdecrypt::ExitData exit;
    exit.timestamp = 50;
    exit.error_msg = "quote \" and newline \n";
    meta.exit_data = exit;

    std::vector<std::uint8_t> header = recdecrypt::EncodeMetadata(meta);
    SessionMetadata back = ReadFrom(std::string(header.begin(), header.end()));
    EXPECT_EQ(back.started_at, 42u);
    EXPECT_EQ(back.data_size, 7u);
    EXPECT_EQ(back.encapsulated_key, "deadbeef");
    ASSERT_TRUE(back.pty.has_value());
    EXPECT_FALSE(back.pty->term.has_value());
    EXPECT_EQ(back.pty->modes, pty.modes);
    ASSERT_TRUE(back.exit_data.has_value());
    EXPECT_EQ(back.exit_data->error_msg, exit.error_msg);
    EXPECT_FALSE(back.exit_data->status.has_value());
}

TEST(MetadataTest, FormatMentionsRawSessions) {
    SessionMetadata meta;
    meta.encapsulated_key = "ab";
    std::string text = recdecrypt::FormatMetadata(meta);
    EXPECT_NE(text.find("1970-01-01 00:00:00+00"), std::string::npos);
    EXPECT_NE(text.find("raw session"), std::string::npos);
    EXPECT_NE(text.find("no termination data"), std::string::npos);
}

}  // namespace
