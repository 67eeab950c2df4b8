#include "recdecrypt/archive.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/errors.hpp"
#include "recdecrypt/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <zlib.h>

#if RECDECRYPT_HAS_LZMA
#include <lzma.h>
#endif

namespace recdecrypt::archive {

namespace {

constexpr std::size_t kTarBlockSize = 512;

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(TarHeader) == kTarBlockSize, "Tar header must be 512 bytes");

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

void WriteOctal(char* dest, std::size_t size, std::uint64_t value) {
    std::snprintf(dest, size, "%0*llo", static_cast<int>(size - 1),
                  static_cast<unsigned long long>(value));
}

// Artifacts are plain files with short names, so only the name field is used.
void WriteHeader(std::ofstream& out, const std::string& entry_name, std::uint64_t size, std::uint64_t mtime) {
    if (entry_name.empty() || entry_name.size() >= sizeof(TarHeader::name)) {
        throw ArchiveError("tar entry name not representable: " + entry_name);
    }
    TarHeader header{};
    std::memcpy(header.name, entry_name.c_str(), entry_name.size());
    WriteOctal(header.mode, sizeof(header.mode), 0600);
    WriteOctal(header.uid, sizeof(header.uid), 0);
    WriteOctal(header.gid, sizeof(header.gid), 0);
    WriteOctal(header.size, sizeof(header.size), size);
    WriteOctal(header.mtime, sizeof(header.mtime), mtime);
    header.typeflag = '0';
    std::memcpy(header.magic, "ustar", 5);
    std::memcpy(header.version, "00", 2);

    std::memset(header.chksum, ' ', sizeof(header.chksum));
    unsigned int sum = 0;
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        sum += bytes[i];
    }
    std::snprintf(header.chksum, sizeof(header.chksum), "%06o", sum);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';

    out.write(reinterpret_cast<const char*>(&header), sizeof(TarHeader));
}

void WriteFileData(std::ofstream& out, const std::filesystem::path& path, std::uint64_t size) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ArchiveError("failed to open file: " + path.string());
    }
    std::array<char, 1 << 16> buffer{};
    std::uint64_t remaining = size;
    while (remaining > 0) {
        std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        input.read(buffer.data(), static_cast<std::streamsize>(chunk));
        if (input.gcount() != static_cast<std::streamsize>(chunk)) {
            throw ArchiveError("failed to read file: " + path.string());
        }
        out.write(buffer.data(), static_cast<std::streamsize>(chunk));
        remaining -= chunk;
    }
    std::size_t pad = static_cast<std::size_t>((kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize);
    if (pad) {
        std::array<char, kTarBlockSize> zeros{};
        out.write(zeros.data(), static_cast<std::streamsize>(pad));
    }
}

void WriteTarArchive(const std::filesystem::path& dir, const std::filesystem::path& tar_path) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && !entry.is_symlink()) {
            files.push_back(entry.path());
        }
    }
    // Stable member order regardless of directory iteration order.
    std::sort(files.begin(), files.end());

    std::ofstream out(tar_path, std::ios::binary);
    if (!out) {
        throw ArchiveError("failed to open tar output: " + tar_path.string());
    }
    const auto mtime = static_cast<std::uint64_t>(std::time(nullptr));
    for (const auto& file : files) {
        std::uint64_t size = static_cast<std::uint64_t>(std::filesystem::file_size(file));
        WriteHeader(out, file.filename().generic_string(), size, mtime);
        WriteFileData(out, file, size);
    }
    std::array<char, kTarBlockSize> zeros{};
    out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
    out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
    out.flush();
    if (!out) {
        throw ArchiveError("failed to write tar output: " + tar_path.string());
    }
    log::Debug("tar: " + std::to_string(files.size()) + " member(s)");
}

// Zip members are small local artifacts, so sizes and offsets stay below
// the 4 GiB limit of the classic format; larger input is rejected.
constexpr std::uint32_t kZipLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kZipCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kZipEndOfCentralSig = 0x06054b50;
constexpr std::uint16_t kZipVersion = 20;
constexpr std::uint16_t kZipMadeByUnix = (3u << 8) | kZipVersion;
constexpr std::uint16_t kZipMethodDeflate = 8;
constexpr std::uint16_t kZipFlagUtf8 = 0x0800;
constexpr std::uint32_t kZipExternalAttrs = 0100600u << 16;
constexpr std::size_t kZipLocalHeaderLen = 30;

struct ZipEntry {
    std::string name;
    std::uint32_t crc = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t size = 0;
    std::uint32_t offset = 0;
};

void PutU16Le(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void PutU32Le(std::string& out, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

std::uint32_t ZipSize(std::uint64_t value, const std::string& what) {
    if (value > 0xFFFFFFFFull) {
        throw ArchiveError(what + " too large for a zip archive");
    }
    return static_cast<std::uint32_t>(value);
}

// MS-DOS date and time, local time, two-second resolution.
std::pair<std::uint16_t, std::uint16_t> DosDateTime(std::time_t now) {
    std::tm tm{};
    if (!localtime_r(&now, &tm) || tm.tm_year < 80) {
        return {static_cast<std::uint16_t>((1 << 5) | 1), 0};
    }
    auto date = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
    auto time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    return {date, time};
}

std::string LocalHeader(const ZipEntry& entry, std::uint16_t dos_date, std::uint16_t dos_time) {
    std::string header;
    PutU32Le(header, kZipLocalHeaderSig);
    PutU16Le(header, kZipVersion);
    PutU16Le(header, kZipFlagUtf8);
    PutU16Le(header, kZipMethodDeflate);
    PutU16Le(header, dos_time);
    PutU16Le(header, dos_date);
    PutU32Le(header, entry.crc);
    PutU32Le(header, entry.compressed_size);
    PutU32Le(header, entry.size);
    PutU16Le(header, static_cast<std::uint16_t>(entry.name.size()));
    PutU16Le(header, 0);
    header += entry.name;
    return header;
}

class DeflateStream {
public:
    DeflateStream() {
        if (deflateInit2(&strm_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("Failed to initialize deflate");
        }
    }
    ~DeflateStream() { deflateEnd(&strm_); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    z_stream* get() noexcept { return &strm_; }

private:
    z_stream strm_{};
};

// Streams one file through raw deflate into `out` and fills in the
// entry's checksum and sizes.
void WriteZipData(std::ofstream& out, const std::filesystem::path& path, ZipEntry& entry) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ArchiveError("failed to open file: " + path.string());
    }
    DeflateStream deflater;
    z_stream* strm = deflater.get();
    std::array<char, 1 << 16> in_buf{};
    std::array<char, 1 << 16> out_buf{};
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t total_in = 0;
    std::uint64_t total_out = 0;
    int flush = Z_NO_FLUSH;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        input.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
        std::streamsize got = input.gcount();
        if (input.bad()) {
            throw ArchiveError("failed to read file: " + path.string());
        }
        crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buf.data()), static_cast<uInt>(got));
        total_in += static_cast<std::uint64_t>(got);
        flush = input.eof() ? Z_FINISH : Z_NO_FLUSH;
        strm->next_in = reinterpret_cast<Bytef*>(in_buf.data());
        strm->avail_in = static_cast<uInt>(got);
        do {
            strm->next_out = reinterpret_cast<Bytef*>(out_buf.data());
            strm->avail_out = static_cast<uInt>(out_buf.size());
            ret = deflate(strm, flush);
            if (ret == Z_STREAM_ERROR) {
                throw std::runtime_error("Deflate failed");
            }
            std::size_t produced = out_buf.size() - strm->avail_out;
            out.write(out_buf.data(), static_cast<std::streamsize>(produced));
            total_out += produced;
        } while (strm->avail_out == 0);
        if (flush == Z_FINISH && ret != Z_STREAM_END) {
            throw std::runtime_error("Deflate did not finish");
        }
    }
    entry.crc = static_cast<std::uint32_t>(crc);
    entry.size = ZipSize(total_in, path.filename().string());
    entry.compressed_size = ZipSize(total_out, path.filename().string());
}

void WriteZipArchive(const std::filesystem::path& dir, const std::filesystem::path& zip_path) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && !entry.is_symlink()) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::ofstream out(zip_path, std::ios::binary);
    if (!out) {
        throw ArchiveError("failed to open zip output: " + zip_path.string());
    }
    auto [dos_date, dos_time] = DosDateTime(std::time(nullptr));
    std::vector<ZipEntry> entries;
    std::uint64_t offset = 0;
    for (const auto& file : files) {
        ZipEntry entry;
        entry.name = file.filename().generic_string();
        if (entry.name.empty() || entry.name.size() > 0xFFFF) {
            throw ArchiveError("zip entry name not representable: " + entry.name);
        }
        entry.offset = ZipSize(offset, "zip archive");
        // Sizes and checksum are patched in once the data is written.
        std::string header = LocalHeader(entry, dos_date, dos_time);
        out.write(header.data(), static_cast<std::streamsize>(header.size()));
        WriteZipData(out, file, entry);
        std::streampos end = out.tellp();
        out.seekp(static_cast<std::streamoff>(offset));
        header = LocalHeader(entry, dos_date, dos_time);
        out.write(header.data(), static_cast<std::streamsize>(kZipLocalHeaderLen));
        out.seekp(end);
        if (!out) {
            throw ArchiveError("failed to write zip output: " + zip_path.string());
        }
        offset += header.size() + entry.compressed_size;
        entries.push_back(std::move(entry));
    }

    std::string central;
    for (const auto& entry : entries) {
        PutU32Le(central, kZipCentralHeaderSig);
        PutU16Le(central, kZipMadeByUnix);
        PutU16Le(central, kZipVersion);
        PutU16Le(central, kZipFlagUtf8);
        PutU16Le(central, kZipMethodDeflate);
        PutU16Le(central, dos_time);
        PutU16Le(central, dos_date);
        PutU32Le(central, entry.crc);
        PutU32Le(central, entry.compressed_size);
        PutU32Le(central, entry.size);
        PutU16Le(central, static_cast<std::uint16_t>(entry.name.size()));
        PutU16Le(central, 0);
        PutU16Le(central, 0);
        PutU16Le(central, 0);
        PutU16Le(central, 0);
        PutU32Le(central, kZipExternalAttrs);
        PutU32Le(central, entry.offset);
        central += entry.name;
    }
    if (entries.size() > 0xFFFF) {
        throw ArchiveError("too many zip entries");
    }
    std::string end_record;
    PutU32Le(end_record, kZipEndOfCentralSig);
    PutU16Le(end_record, 0);
    PutU16Le(end_record, 0);
    PutU16Le(end_record, static_cast<std::uint16_t>(entries.size()));
    PutU16Le(end_record, static_cast<std::uint16_t>(entries.size()));
    PutU32Le(end_record, ZipSize(central.size(), "zip central directory"));
    PutU32Le(end_record, ZipSize(offset, "zip archive"));
    PutU16Le(end_record, 0);

    out.write(central.data(), static_cast<std::streamsize>(central.size()));
    out.write(end_record.data(), static_cast<std::streamsize>(end_record.size()));
    out.flush();
    if (!out) {
        throw ArchiveError("failed to write zip output: " + zip_path.string());
    }
    log::Debug("zip: " + std::to_string(entries.size()) + " member(s)");
}

void CompressGzip(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  int level) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open input for gzip: " + input.string());
    }
    std::string mode = "wb" + std::to_string(level);
    gzFile gz = gzopen(output.string().c_str(), mode.c_str());
    if (!gz) {
        throw std::runtime_error("Failed to open gzip output: " + output.string());
    }
    std::array<char, 1 << 16> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            int written = gzwrite(gz, buffer.data(), static_cast<unsigned int>(got));
            if (written == 0) {
                gzclose(gz);
                throw std::runtime_error("Failed to write gzip output");
            }
        }
    }
    if (gzclose(gz) != Z_OK) {
        throw std::runtime_error("Failed to finish gzip output");
    }
}

#if RECDECRYPT_HAS_LZMA
void CompressXz(const std::filesystem::path& input, const std::filesystem::path& output) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open input for xz: " + input.string());
    }
    std::ofstream out(output, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to open xz output: " + output.string());
    }
    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_easy_encoder(&strm, 6, LZMA_CHECK_CRC64);
    if (ret != LZMA_OK) {
        throw std::runtime_error("Failed to initialize xz encoder");
    }
    std::array<std::uint8_t, 1 << 16> in_buf{};
    std::array<std::uint8_t, 1 << 16> out_buf{};
    while (true) {
        in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
        std::streamsize got = in.gcount();
        strm.next_in = in_buf.data();
        strm.avail_in = static_cast<std::size_t>(got);
        lzma_action action = in.eof() ? LZMA_FINISH : LZMA_RUN;
        do {
            strm.next_out = out_buf.data();
            strm.avail_out = out_buf.size();
            ret = lzma_code(&strm, action);
            if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
                lzma_end(&strm);
                throw std::runtime_error("XZ compression failed");
            }
            std::size_t write_size = out_buf.size() - strm.avail_out;
            if (write_size > 0) {
                out.write(reinterpret_cast<char*>(out_buf.data()),
                          static_cast<std::streamsize>(write_size));
            }
        } while (strm.avail_out == 0);
        if (ret == LZMA_STREAM_END) {
            break;
        }
    }
    lzma_end(&strm);
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write xz output: " + output.string());
    }
}
#endif

void CompressArchive(const std::filesystem::path& tar_path,
                     const std::filesystem::path& archive_path,
                     PackMode mode) {
    if (mode == PackMode::Tgz) {
        CompressGzip(tar_path, archive_path, Z_DEFAULT_COMPRESSION);
        return;
    }
#if RECDECRYPT_HAS_LZMA
    CompressXz(tar_path, archive_path);
#else
    throw ArchiveError("XZ support unavailable (liblzma missing)");
#endif
}

}  // namespace

std::optional<PackMode> PackModeFromExtension(const std::filesystem::path& path) {
    std::string ext = ToLower(path.extension().string());
    if (ext == constants::kZipExt) {
        return PackMode::Zip;
    }
    if (ext == constants::kTgzExt) {
        return PackMode::Tgz;
    }
    if (ext == constants::kTxzExt) {
        return PackMode::Txz;
    }
    return std::nullopt;
}

std::string_view PackExtension(PackMode mode) {
    switch (mode) {
    case PackMode::Zip:
        return constants::kZipExt;
    case PackMode::Tgz:
        return constants::kTgzExt;
    case PackMode::Txz:
        return constants::kTxzExt;
    }
    return constants::kZipExt;
}

std::filesystem::path DefaultArchivePath(const std::filesystem::path& input, PackMode mode) {
    std::string name = input.string();
    name += constants::kDecryptedSuffix;
    name += PackExtension(mode);
    return std::filesystem::path(name);
}

std::pair<std::filesystem::path, PackMode> ResolveArchivePath(const std::filesystem::path& input,
                                                              const std::optional<std::filesystem::path>& output,
                                                              bool compress) {
    if (!output) {
        PackMode mode = compress ? PackMode::Txz : PackMode::Zip;
        return {DefaultArchivePath(input, mode), mode};
    }
    std::optional<PackMode> mode = PackModeFromExtension(*output);
    if (!mode) {
        throw ArchiveError("output file name must have a .zip, .tgz or .txz extension: " + output->string());
    }
    return {*output, *mode};
}

void PackDirectory(const std::filesystem::path& dir,
                   const std::filesystem::path& archive_path,
                   PackMode mode) {
    try {
        if (mode == PackMode::Zip) {
            WriteZipArchive(dir, archive_path);
        } else {
            TempDir staging("recdecrypt-pack");
            auto tar_path = staging.path() / "payload.tar";
            WriteTarArchive(dir, tar_path);
            CompressArchive(tar_path, archive_path, mode);
        }
    } catch (const ArchiveError&) {
        std::error_code ec;
        std::filesystem::remove(archive_path, ec);
        throw;
    } catch (const std::exception& exc) {
        std::error_code ec;
        std::filesystem::remove(archive_path, ec);
        throw ArchiveError(std::string("failed to pack ") + archive_path.string() + ": " + exc.what());
    }
    log::Debug("packed " + dir.string() + " into " + archive_path.string());
}

std::filesystem::path CreateTempDir(const std::string& prefix) {
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (int i = 0; i < 64; ++i) {
        auto token = std::to_string(gen());
        auto candidate = base / (prefix + "-" + token);
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            std::filesystem::permissions(candidate, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
            return candidate;
        }
    }
    throw std::runtime_error("Failed to create temporary directory");
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        log::Warn("could not remove temporary directory " + path_.string() + ": " + ec.message());
    }
}

}  // namespace recdecrypt::archive
