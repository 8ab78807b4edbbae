#include "neo/cli_colors.hpp"
#include "neo/env.hpp"
#include "neo/errors.hpp"
#include "neo/filecodec.hpp"

#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  neo [--leading-bytes <n>] [--chunk-size <n>] [--no-color] [--pause] <file>...\n";
    std::cout << "\n";
    std::cout << "Plain files are wrapped into <random>.neo next to them; .neo containers are\n";
    std::cout << "restored under their recorded name after the CRC-32 check passes.\n";
}

struct CliArgs {
    std::vector<std::string> paths;
    neo::filecodec::FileOptions file;
    bool pause = false;
    bool help = false;
};

std::size_t ParseSize(const std::string& flag, const std::string& raw) {
    std::size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(raw, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + flag + ": " + raw);
    }
    if (consumed != raw.size() || raw[0] == '-') {
        throw std::runtime_error("Invalid value for " + flag + ": " + raw);
    }
    return static_cast<std::size_t>(value);
}

CliArgs ParseArgs(int argc, char** argv) {
    CliArgs opts;
#if defined(_WIN32) || defined(_WIN64)
    opts.pause = true;
#endif
    opts.pause = opts.pause || neo::env::IsEnabled("NEO_PAUSE");
    int idx = 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--leading-bytes") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing leading byte count");
            }
            opts.file.leading_bytes = ParseSize(flag, argv[idx + 1]);
            idx += 2;
        } else if (flag == "--chunk-size") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing chunk size");
            }
            opts.file.chunk_size = ParseSize(flag, argv[idx + 1]);
            if (opts.file.chunk_size == 0) {
                throw std::runtime_error("Chunk size must be positive");
            }
            idx += 2;
        } else if (flag == "--no-color") {
            neo::cli::SetColorsEnabled(false);
            idx += 1;
        } else if (flag == "--pause") {
            opts.pause = true;
            idx += 1;
        } else if (flag == "-h" || flag == "--help") {
            opts.help = true;
            idx += 1;
        } else if (flag == "--") {
            for (++idx; idx < argc; ++idx) {
                opts.paths.emplace_back(argv[idx]);
            }
        } else if (flag.size() > 1 && flag[0] == '-') {
            throw std::runtime_error("Unknown flag: " + flag);
        } else {
            opts.paths.push_back(flag);
            idx += 1;
        }
    }
    return opts;
}

// Returns false when the path was skipped or failed.
bool HandlePath(const std::string& item, const neo::filecodec::FileOptions& options) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::file_status status = fs::status(item, ec);
    if (ec || !fs::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            neo::cli::LogWarn("cannot stat " + neo::cli::Cyan(item) + ": " + ec.message());
        } else {
            neo::cli::LogWarn(neo::cli::Cyan(item) + " does not exist");
        }
        return false;
    }
    if (!fs::is_regular_file(status)) {
        neo::cli::LogWarn(neo::cli::Cyan(item) + " is not a regular file, skipping");
        return false;
    }

    try {
        if (neo::filecodec::IsContainerFile(item)) {
            std::string out = neo::filecodec::DecodeFile(item, options);
            neo::cli::LogInfo("decoded " + neo::cli::Cyan(item) + " -> " + neo::cli::Cyan(out));
        } else {
            std::string out = neo::filecodec::EncodeFile(item, options);
            neo::cli::LogInfo("encoded " + neo::cli::Cyan(item) + " -> " + neo::cli::Cyan(out));
        }
        return true;
    } catch (const neo::Error& exc) {
        if (exc.kind() == neo::ErrorKind::ChecksumMismatch) {
            neo::cli::LogError(neo::cli::Cyan(item) + " is corrupted, output discarded: " + exc.what());
        } else {
            neo::cli::LogError(neo::cli::Cyan(item) + ": " + exc.what());
        }
    } catch (const std::exception& exc) {
        neo::cli::LogError(neo::cli::Cyan(item) + ": " + exc.what());
    }
    return false;
}

void WaitForEnter() {
    std::cout << "Press the Enter key to exit" << std::endl;
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

}  // namespace

int main(int argc, char** argv) {
    CliArgs opts;
    try {
        opts = ParseArgs(argc, argv);
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage();
        return 2;
    }
    if (opts.help || opts.paths.empty()) {
        PrintUsage();
        return opts.help ? 0 : 2;
    }

    bool all_ok = true;
    for (const auto& item : opts.paths) {
        all_ok = HandlePath(item, opts.file) && all_ok;
    }

    if (opts.pause) {
        WaitForEnter();
    }
    return all_ok ? 0 : 1;
}
