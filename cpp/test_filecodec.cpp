#include "neo/container.hpp"
#include "neo/crypto.hpp"
#include "neo/filecodec.hpp"

#include "test_check.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

using neo::ErrorKind;
using neo::crypto::Bytes;
using neo::test::Check;
using neo::test::ThrowsKind;

namespace {

void WriteBytes(const fs::path& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

Bytes ReadBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::size_t CountEntries(const fs::path& dir) {
    return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

fs::path MakeWorkDir() {
    Bytes tag = neo::crypto::RandomBytes(4);
    std::string name = "neo_filecodec_test_";
    for (std::uint8_t byte : tag) {
        name += "0123456789abcdef"[byte >> 4];
        name += "0123456789abcdef"[byte & 0x0F];
    }
    fs::path dir = fs::temp_directory_path() / name;
    fs::create_directories(dir);
    return dir;
}

}  // namespace

int main() {
    std::cout << "File codec:" << std::endl;
    fs::path dir = MakeWorkDir();
    neo::filecodec::FileOptions options;
    options.leading_bytes = 8;
    options.chunk_size = 1000;

    Bytes data = neo::crypto::RandomBytes(5000);
    fs::path source = dir / "sample.bin";
    WriteBytes(source, data);

    Check(neo::filecodec::FileChecksum(source.string(), 7) == neo::crypto::Crc32Of(data),
          "file checksum matches in-memory checksum");
    Check(!neo::filecodec::IsContainerFile(source.string()), "plain file is not a container");

    std::string encoded = neo::filecodec::EncodeFile(source.string(), options);
    fs::path encoded_path(encoded);
    Check(encoded_path.parent_path() == dir && encoded_path.extension() == ".neo"
              && encoded_path.stem().string().size() == 8,
          "container lands next to the input with a random name");
    Check(fs::exists(source), "input file is kept");
    Check(neo::filecodec::IsContainerFile(encoded), "output is a container");

    fs::remove(source);
    std::string decoded = neo::filecodec::DecodeFile(encoded, options);
    Check(fs::path(decoded) == source, "decoded file takes its recorded name");
    Check(ReadBytes(source) == data, "decoded bytes match the original");
    Check(!fs::exists(encoded + ".decoding"), "temporary file is gone");

    {
        Bytes corrupt = ReadBytes(encoded);
        corrupt[corrupt.size() - 100] ^= 0x80;
        fs::path corrupt_path = dir / "corrupt.neo";
        WriteBytes(corrupt_path, corrupt);
        fs::remove(source);
        std::size_t before = CountEntries(dir);
        Check(ThrowsKind([&] { neo::filecodec::DecodeFile(corrupt_path.string(), options); },
                         ErrorKind::ChecksumMismatch),
              "corrupted container reports checksum mismatch");
        Check(!fs::exists(source) && CountEntries(dir) == before, "failed decode leaves nothing behind");
    }

    {
        fs::path tiny = dir / "tiny.txt";
        WriteBytes(tiny, Bytes{'h', 'i', '!'});
        std::string out = neo::filecodec::ProcessFile(tiny.string(), options);
        Check(neo::filecodec::IsContainerFile(out), "process encodes a plain file");
        fs::remove(tiny);
        Check(neo::filecodec::ProcessFile(out, options) == tiny.string() && ReadBytes(tiny) == Bytes{'h', 'i', '!'},
              "process decodes a container shorter than the leading bytes");
    }

    {
        fs::path empty = dir / "empty.dat";
        WriteBytes(empty, Bytes{});
        std::string out = neo::filecodec::EncodeFile(empty.string(), options);
        fs::remove(empty);
        Check(neo::filecodec::DecodeFile(out, options) == empty.string() && fs::file_size(empty) == 0,
              "empty file round trip");
    }

    {
        fs::path unicode = dir / fs::u8path("\xe6\x96\x87\xe4\xbb\xb6\xe2\x9d\xa4.rar");
        Bytes content = neo::test::PatternBytes(777);
        WriteBytes(unicode, content);
        std::string out = neo::filecodec::EncodeFile(unicode.string(), options);
        fs::remove(unicode);
        Check(fs::path(neo::filecodec::DecodeFile(out, options)) == unicode && ReadBytes(unicode) == content,
              "UTF-8 filename round trip");
    }

    {
        Bytes content = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
        fs::path crafted = dir / "crafted.neo";
        {
            std::ofstream sink(crafted, std::ios::binary | std::ios::trunc);
            neo::container::ContainerWriter writer(sink, 4, "../escaped.txt", neo::crypto::Crc32Of(content));
            writer.Write(content);
            writer.Close();
        }
        std::string out = neo::filecodec::DecodeFile(crafted.string(), options);
        Check(fs::path(out) == dir / "escaped.txt" && ReadBytes(out) == content,
              "recorded directories are stripped from the restored name");
    }

    {
        fs::path short_file = dir / "short";
        WriteBytes(short_file, Bytes{0xFF, 0x4E});
        Check(!neo::filecodec::IsContainerFile(short_file.string()), "file shorter than magic is plain");
    }

    Check(ThrowsKind([&] { neo::filecodec::EncodeFile((dir / "missing").string(), options); }, ErrorKind::Io),
          "missing input is an i/o error");

    std::error_code ec;
    fs::remove_all(dir, ec);
    return neo::test::Finish("test_filecodec");
}
