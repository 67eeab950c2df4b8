#include <gtest/gtest.h>

#include "recdecrypt/archive.hpp"
#include "recdecrypt/errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>

#include <zlib.h>

#if RECDECRYPT_HAS_LZMA
#include <lzma.h>
#endif

namespace archive = recdecrypt::archive;
namespace fs = std::filesystem;

namespace {

std::string ReadGzip(const fs::path& path) {
    gzFile gz = gzopen(path.string().c_str(), "rb");
    if (!gz) {
        ADD_FAILURE() << "cannot open " << path;
        return {};
    }
    std::string out;
    char buffer[4096];
    int n = 0;
    while ((n = gzread(gz, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<std::size_t>(n));
    }
    gzclose(gz);
    return out;
}

#if RECDECRYPT_HAS_LZMA
std::string ReadXz(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::string compressed((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::string out(1 << 20, '\0');
    std::uint64_t memlimit = UINT64_MAX;
    std::size_t in_pos = 0;
    std::size_t out_pos = 0;
    lzma_ret ret = lzma_stream_buffer_decode(&memlimit, 0, nullptr,
                                             reinterpret_cast<const std::uint8_t*>(compressed.data()), &in_pos,
                                             compressed.size(),
                                             reinterpret_cast<std::uint8_t*>(&out[0]), &out_pos, out.size());
    EXPECT_EQ(ret, LZMA_OK);
    out.resize(out_pos);
    return out;
}
#endif

// Member name -> contents for a ustar stream of regular files.
std::map<std::string, std::string> ListTar(const std::string& tar) {
    std::map<std::string, std::string> members;
    std::size_t pos = 0;
    while (pos + 512 <= tar.size()) {
        std::string name(tar.c_str() + pos);
        if (name.empty()) {
            break;
        }
        EXPECT_EQ(tar.compare(pos + 257, 5, "ustar"), 0);
        std::size_t size = std::strtoul(tar.substr(pos + 124, 12).c_str(), nullptr, 8);
        members[name] = tar.substr(pos + 512, size);
        pos += 512 + ((size + 511) / 512) * 512;
    }
    return members;
}

std::uint32_t LoadU32Le(const std::string& data, std::size_t pos) {
    return static_cast<std::uint32_t>(static_cast<unsigned char>(data[pos]))
        | (static_cast<std::uint32_t>(static_cast<unsigned char>(data[pos + 1])) << 8)
        | (static_cast<std::uint32_t>(static_cast<unsigned char>(data[pos + 2])) << 16)
        | (static_cast<std::uint32_t>(static_cast<unsigned char>(data[pos + 3])) << 24);
}

std::uint16_t LoadU16Le(const std::string& data, std::size_t pos) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(data[pos])
                                      | (static_cast<unsigned char>(data[pos + 1]) << 8));
}

std::string InflateRaw(const std::string& compressed, std::size_t size) {
    // One spare byte so an empty member still has room to finish.
    std::string out(size + 1, '\0');
    z_stream strm{};
    EXPECT_EQ(inflateInit2(&strm, -MAX_WBITS), Z_OK);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_out = reinterpret_cast<Bytef*>(&out[0]);
    strm.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(inflate(&strm, Z_FINISH), Z_STREAM_END);
    EXPECT_EQ(strm.total_out, size);
    inflateEnd(&strm);
    out.resize(size);
    return out;
}

// Member name -> contents, walking the central directory of a zip file
// and checking each member's local header and CRC-32.
std::map<std::string, std::string> ListZip(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::string zip((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::map<std::string, std::string> members;
    if (zip.size() < 22) {
        ADD_FAILURE() << "zip too short";
        return members;
    }
    std::size_t eocd = zip.size() - 22;
    EXPECT_EQ(LoadU32Le(zip, eocd), 0x06054b50u);
    std::uint16_t count = LoadU16Le(zip, eocd + 10);
    std::size_t pos = LoadU32Le(zip, eocd + 16);
    for (std::uint16_t i = 0; i < count; ++i) {
        EXPECT_EQ(LoadU32Le(zip, pos), 0x02014b50u);
        EXPECT_EQ(LoadU16Le(zip, pos + 10), 8u);
        std::uint32_t crc = LoadU32Le(zip, pos + 16);
        std::uint32_t compressed_size = LoadU32Le(zip, pos + 20);
        std::uint32_t size = LoadU32Le(zip, pos + 24);
        std::uint16_t name_len = LoadU16Le(zip, pos + 28);
        std::uint16_t extra_len = LoadU16Le(zip, pos + 30);
        std::uint16_t comment_len = LoadU16Le(zip, pos + 32);
        std::uint32_t offset = LoadU32Le(zip, pos + 42);
        std::string name = zip.substr(pos + 46, name_len);

        EXPECT_EQ(LoadU32Le(zip, offset), 0x04034b50u);
        EXPECT_EQ(LoadU32Le(zip, offset + 14), crc);
        EXPECT_EQ(LoadU32Le(zip, offset + 18), compressed_size);
        EXPECT_EQ(LoadU32Le(zip, offset + 22), size);
        std::size_t data = offset + 30 + LoadU16Le(zip, offset + 26) + LoadU16Le(zip, offset + 28);
        std::string contents = InflateRaw(zip.substr(data, compressed_size), size);
        EXPECT_EQ(crc32(0L, reinterpret_cast<const Bytef*>(contents.data()), static_cast<uInt>(contents.size())),
                  crc);
        members[name] = contents;
        pos += 46 + name_len + extra_len + comment_len;
    }
    return members;
}

class ArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = archive::CreateTempDir("recdecrypt-test-src");
        out_ = archive::CreateTempDir("recdecrypt-test-out");
        Write(source_ / "term_data.txt", "hello transcript");
        Write(source_ / "term_times.txt", std::string(1000, 't'));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(source_, ec);
        fs::remove_all(out_, ec);
    }

    static void Write(const fs::path& path, const std::string& data) {
        std::ofstream out(path, std::ios::binary);
        out << data;
    }

    fs::path source_;
    fs::path out_;
};

TEST_F(ArchiveTest, PacksDirectoryAsZip) {
    Write(source_ / "empty.txt", "");
    fs::path target = out_ / "session.zip";
    archive::PackDirectory(source_, target, archive::PackMode::Zip);
    auto members = ListZip(target);
    ASSERT_EQ(members.size(), 3u);
    EXPECT_EQ(members["term_data.txt"], "hello transcript");
    EXPECT_EQ(members["term_times.txt"], std::string(1000, 't'));
    EXPECT_EQ(members["empty.txt"], "");
}

TEST_F(ArchiveTest, ZipHoldsLargeIncompressibleMember) {
    std::string noise(200000, '\0');
    std::uint32_t state = 12345;
    for (char& ch : noise) {
        state = state * 1103515245u + 12345u;
        ch = static_cast<char>(state >> 24);
    }
    Write(source_ / "data_from_server.txt", noise);
    fs::path target = out_ / "session.zip";
    archive::PackDirectory(source_, target, archive::PackMode::Zip);
    auto members = ListZip(target);
    EXPECT_EQ(members["data_from_server.txt"], noise);
}

TEST_F(ArchiveTest, PacksDirectoryAsTgz) {
    fs::path target = out_ / "session.tgz";
    archive::PackDirectory(source_, target, archive::PackMode::Tgz);
    auto members = ListTar(ReadGzip(target));
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members["term_data.txt"], "hello transcript");
    EXPECT_EQ(members["term_times.txt"], std::string(1000, 't'));
}

#if RECDECRYPT_HAS_LZMA
TEST_F(ArchiveTest, PacksDirectoryAsTxz) {
    fs::path target = out_ / "session.txz";
    archive::PackDirectory(source_, target, archive::PackMode::Txz);
    auto members = ListTar(ReadXz(target));
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members["term_data.txt"], "hello transcript");
}
#endif

TEST(ArchivePathTest, ModeFromExtension) {
    EXPECT_EQ(archive::PackModeFromExtension("a.zip"), archive::PackMode::Zip);
    EXPECT_EQ(archive::PackModeFromExtension("a.tgz"), archive::PackMode::Tgz);
    EXPECT_EQ(archive::PackModeFromExtension("a.TXZ"), archive::PackMode::Txz);
    EXPECT_FALSE(archive::PackModeFromExtension("a.tar").has_value());
    EXPECT_FALSE(archive::PackModeFromExtension("tgz").has_value());
}

TEST(ArchivePathTest, DefaultNameFollowsInput) {
    auto resolved = archive::ResolveArchivePath("dir/rec.bin", std::nullopt, false);
    EXPECT_EQ(resolved.first, fs::path("dir/rec.bin-decrypted.zip"));
    EXPECT_EQ(resolved.second, archive::PackMode::Zip);
    resolved = archive::ResolveArchivePath("rec.bin", std::nullopt, true);
    EXPECT_EQ(resolved.first, fs::path("rec.bin-decrypted.txz"));
    EXPECT_EQ(resolved.second, archive::PackMode::Txz);
}

TEST(ArchivePathTest, ExplicitNameMustHaveArchiveExtension) {
    auto resolved = archive::ResolveArchivePath("rec.bin", fs::path("out.txz"), false);
    EXPECT_EQ(resolved.second, archive::PackMode::Txz);
    resolved = archive::ResolveArchivePath("rec.bin", fs::path("out.zip"), true);
    EXPECT_EQ(resolved.second, archive::PackMode::Zip);
    EXPECT_THROW(archive::ResolveArchivePath("rec.bin", fs::path("out.rar"), false), recdecrypt::ArchiveError);
}

TEST(TempDirTest, RemovesContentsOnDestruction) {
    fs::path path;
    {
        archive::TempDir dir("recdecrypt-test");
        path = dir.path();
        ASSERT_TRUE(fs::is_directory(path));
        std::ofstream(path / "file") << "x";
    }
    EXPECT_FALSE(fs::exists(path));
}

}  // namespace
