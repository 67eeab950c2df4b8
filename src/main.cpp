#include "recdecrypt/cli_colors.hpp"
#include "recdecrypt/constants.hpp"
#include "recdecrypt/env.hpp"
#include "recdecrypt/log.hpp"
#include "recdecrypt/metadata.hpp"
#include "recdecrypt/recording.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  recdecrypt decrypt -i <file> [-k <keyfile>] [-r] [-o <out.zip|out.tgz|out.txz>] [-d <dir>] [--compress] [-v] [--no-color]\n";
    std::cout << "  recdecrypt generate-key-pair -o <keyfile>\n";
    std::cout << "  recdecrypt info -i <file>\n";
    std::cout << "\n";
    std::cout << "  -k defaults to $" << recdecrypt::constants::kEnvPrivateKeyFile << "\n";
}

struct DecryptArgs {
    recdecrypt::DecryptOptions options;
    bool verbose = false;
    bool no_color = false;
};

std::string TakeValue(int argc, char** argv, int& idx, const char* what) {
    if (idx + 1 >= argc) {
        throw UsageError(std::string("Missing ") + what);
    }
    std::string value(argv[idx + 1]);
    idx += 2;
    return value;
}

DecryptArgs ParseDecryptArgs(int argc, char** argv, int start_index) {
    DecryptArgs args;
    std::string key_file;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-i" || flag == "--input") {
            args.options.input = TakeValue(argc, argv, idx, "input file");
        } else if (flag == "-k" || flag == "--private-key") {
            key_file = TakeValue(argc, argv, idx, "private key file");
        } else if (flag == "-r" || flag == "--replay") {
            args.options.replay = true;
            idx += 1;
        } else if (flag == "-o" || flag == "--output") {
            args.options.output = TakeValue(argc, argv, idx, "output file name");
        } else if (flag == "-d" || flag == "--output-dir") {
            args.options.output_dir = TakeValue(argc, argv, idx, "output directory");
        } else if (flag == "--compress") {
            args.options.compress = true;
            idx += 1;
        } else if (flag == "-v" || flag == "--verbose") {
            args.verbose = true;
            idx += 1;
        } else if (flag == "--no-color") {
            args.no_color = true;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (args.options.input.empty()) {
        throw UsageError("Missing input file (-i)");
    }
    if (key_file.empty()) {
        key_file = recdecrypt::env::Get(recdecrypt::constants::kEnvPrivateKeyFile);
    }
    if (key_file.empty()) {
        throw UsageError("Missing private key file (-k or $"
                         + std::string(recdecrypt::constants::kEnvPrivateKeyFile) + ")");
    }
    args.options.private_key_file = key_file;
    if (args.options.replay && (args.options.output || args.options.output_dir)) {
        throw UsageError("--replay conflicts with --output and --output-dir");
    }
    if (args.options.output && args.options.output_dir) {
        throw UsageError("--output conflicts with --output-dir");
    }
    return args;
}

std::string ParseSingleFlag(int argc, char** argv, int start_index, const char* short_flag, const char* long_flag,
                            const char* what) {
    std::string value;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == short_flag || flag == long_flag) {
            value = TakeValue(argc, argv, idx, what);
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (value.empty()) {
        throw UsageError(std::string("Missing ") + what + " (" + short_flag + ")");
    }
    return value;
}

int RunDecrypt(const DecryptArgs& args) {
    if (args.no_color) {
        recdecrypt::cli::SetColorsEnabled(false);
    }
    if (args.verbose) {
        recdecrypt::log::SetLevel(recdecrypt::log::Level::Debug);
    }
    recdecrypt::DecryptResult result = recdecrypt::DecryptRecording(args.options);
    const recdecrypt::SessionSummary& summary = result.summary;
    std::string kind = summary.has_pty() ? "pty" : "raw";
    recdecrypt::log::Info("decrypted " + std::to_string(summary.bytes_decrypted) + " bytes in "
                          + std::to_string(summary.chunks_opened) + " chunk(s), " + kind + " session");
    if (!result.destination.empty()) {
        std::cout << recdecrypt::cli::Colorize(result.destination.string(), recdecrypt::cli::color::GREEN, std::cout) << "\n";
    }
    return 0;
}

int RunGenerateKeyPair(const std::filesystem::path& private_path) {
    recdecrypt::WriteKeyPair(private_path);
    std::cout << private_path.string() << "\n";
    std::cout << recdecrypt::PublicKeyPath(private_path).string() << "\n";
    return 0;
}

int RunInfo(const std::filesystem::path& input) {
    std::ifstream recording(input, std::ios::binary);
    if (!recording) {
        throw std::runtime_error("Could not open input file: " + input.string());
    }
    recdecrypt::SessionMetadata meta = recdecrypt::ReadMetadata(recording);
    std::cout << recdecrypt::FormatMetadata(meta);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    recdecrypt::log::InitFromEnv();
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "decrypt") {
            return RunDecrypt(ParseDecryptArgs(argc, argv, 2));
        }
        if (command == "generate-key-pair") {
            return RunGenerateKeyPair(ParseSingleFlag(argc, argv, 2, "-o", "--output", "output file name"));
        }
        if (command == "info") {
            return RunInfo(ParseSingleFlag(argc, argv, 2, "-i", "--input", "input file"));
        }
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << recdecrypt::cli::Red(std::string("Error: ") + exc.what()) << "\n";
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << recdecrypt::cli::Red(std::string("Error: ") + exc.what()) << "\n";
        return 1;
    }
}
