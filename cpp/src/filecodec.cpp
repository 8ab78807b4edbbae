#include "neo/filecodec.hpp"

#include "neo/container.hpp"
#include "neo/crypto.hpp"
#include "neo/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace neo::filecodec {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kNameAlphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

// Removes the file on scope exit unless Release() was called.
class TempFile {
public:
    explicit TempFile(fs::path path) : path_(std::move(path)) {}
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    ~TempFile() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    const fs::path& path() const noexcept { return path_; }
    void Release() noexcept { released_ = true; }

private:
    fs::path path_;
    bool released_ = false;
};

std::ifstream OpenInput(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw Error(ErrorKind::Io, "failed to open file for reading: " + path.string());
    }
    return input;
}

std::ofstream OpenOutput(const fs::path& path) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw Error(ErrorKind::Io, "failed to open file for writing: " + path.string());
    }
    return output;
}

std::string RandomName(std::size_t len) {
    crypto::Bytes raw = crypto::RandomBytes(len);
    std::string name;
    name.reserve(len);
    for (std::uint8_t byte : raw) {
        name.push_back(kNameAlphabet[byte % kNameAlphabet.size()]);
    }
    return name;
}

fs::path FreshContainerPath(const fs::path& dir) {
    for (;;) {
        fs::path candidate = dir / (RandomName(constants::kOutputNameLen) + std::string(constants::kContainerExt));
        std::error_code ec;
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

// Only the last component of the recorded name is trusted.
fs::path RestoredPath(const fs::path& dir, const std::string& recorded) {
    fs::path name = fs::u8path(recorded).filename();
    if (name.empty() || name == "." || name == "..") {
        throw Error(ErrorKind::NotAContainer, "container records no usable filename");
    }
    return dir / name;
}

}  // namespace

std::uint32_t FileChecksum(const std::string& path, std::size_t chunk_size) {
    std::ifstream input = OpenInput(path);
    crypto::Crc32 crc;
    std::vector<std::uint8_t> buffer(chunk_size > 0 ? chunk_size : constants::kStreamChunkSize);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = input.gcount();
        if (input.bad()) {
            throw Error(ErrorKind::Io, "failed to read " + path);
        }
        if (got <= 0) {
            break;
        }
        crc.Update(buffer.data(), static_cast<std::size_t>(got));
    }
    return crc.Value();
}

bool IsContainerFile(const std::string& path) {
    std::ifstream input = OpenInput(path);
    return container::LooksLikeContainer(input);
}

std::string EncodeFile(const std::string& path, const FileOptions& options) {
    fs::path input_path(path);
    container::EncodeOptions encode;
    encode.leading_bytes = options.leading_bytes;
    encode.chunk_size = options.chunk_size;
    encode.filename = input_path.filename().u8string();
    encode.checksum = FileChecksum(path, options.chunk_size);

    std::ifstream input = OpenInput(input_path);
    TempFile output(FreshContainerPath(input_path.parent_path()));
    {
        std::ofstream sink = OpenOutput(output.path());
        container::EncodeStream(input, sink, encode);
        sink.close();
        if (!sink) {
            throw Error(ErrorKind::Io, "failed to close " + output.path().string());
        }
    }
    output.Release();
    return output.path().string();
}

std::string DecodeFile(const std::string& path, const FileOptions& options) {
    fs::path input_path(path);
    std::ifstream input = OpenInput(input_path);
    TempFile output(fs::path(path + std::string(constants::kDecodingSuffix)));

    container::DecodeResult result;
    {
        std::ofstream sink = OpenOutput(output.path());
        result = container::DecodeStream(input, sink, options.chunk_size);
        sink.close();
        if (!sink) {
            throw Error(ErrorKind::Io, "failed to close " + output.path().string());
        }
    }

    fs::path final_path = RestoredPath(input_path.parent_path(), result.header.original_filename);
    std::error_code ec;
    fs::rename(output.path(), final_path, ec);
    if (ec) {
        throw Error(ErrorKind::Io, "failed to rename " + output.path().string() + " to "
                                       + final_path.string() + ": " + ec.message());
    }
    output.Release();
    return final_path.string();
}

std::string ProcessFile(const std::string& path, const FileOptions& options) {
    if (IsContainerFile(path)) {
        return DecodeFile(path, options);
    }
    return EncodeFile(path, options);
}

}  // namespace neo::filecodec
