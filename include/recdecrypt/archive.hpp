#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace recdecrypt::archive {

enum class PackMode {
    Zip,
    Tgz,
    Txz
};

std::optional<PackMode> PackModeFromExtension(const std::filesystem::path& path);
std::string_view PackExtension(PackMode mode);

// `<input>-decrypted.zip` (or `.tgz`, `.txz`) next to the input recording.
std::filesystem::path DefaultArchivePath(const std::filesystem::path& input, PackMode mode);

// Picks the archive path and mode for a decrypt run. Without an output
// name the archive is a zip, or a txz when `compress` is set. An explicit
// output name decides the mode by its extension: .zip, .tgz or .txz.
std::pair<std::filesystem::path, PackMode> ResolveArchivePath(const std::filesystem::path& input,
                                                              const std::optional<std::filesystem::path>& output,
                                                              bool compress);

// Packs the regular files directly under `dir` into a deflate zip or a
// compressed tar. Entry names are relative to `dir`. Throws ArchiveError.
void PackDirectory(const std::filesystem::path& dir,
                   const std::filesystem::path& archive_path,
                   PackMode mode);

std::filesystem::path CreateTempDir(const std::string& prefix);

// Owns a temporary directory and removes it with its contents.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) : path_(CreateTempDir(prefix)) {}
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace recdecrypt::archive
