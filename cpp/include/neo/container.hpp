#pragma once

#include "neo/constants.hpp"
#include "neo/crypto.hpp"
#include "neo/header.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace neo::container {

using Bytes = std::vector<std::uint8_t>;
using header::Header;

// Push side. Holds back the first `leading_bytes` bytes of content, then emits the
// header carrying them and passes every later byte straight to the sink.
class ContainerWriter {
public:
    ContainerWriter(std::ostream& sink,
                    std::size_t leading_bytes,
                    std::string filename,
                    std::uint32_t checksum,
                    crypto::RandomSource random = crypto::SystemRandom());

    ContainerWriter(const ContainerWriter&) = delete;
    ContainerWriter& operator=(const ContainerWriter&) = delete;

    // Returns the number of bytes consumed, which is always len.
    std::size_t Write(const std::uint8_t* data, std::size_t len);
    std::size_t Write(const Bytes& chunk) { return Write(chunk.data(), chunk.size()); }

    // Emits the header if content ended before leading_bytes were seen, then flushes.
    void Close();

    bool header_written() const noexcept { return header_written_; }

private:
    void FlushHeader();
    void WriteToSink(const std::uint8_t* data, std::size_t len);

    std::ostream& sink_;
    std::size_t leading_bytes_;
    Header header_;
    crypto::RandomSource random_;
    Bytes buffer_;
    bool header_written_ = false;
};

// Pull side. Parses the header on the first read, replays its leading bytes, then
// reads the rest of the source through unchanged.
class ContainerReader {
public:
    explicit ContainerReader(std::istream& source);

    ContainerReader(const ContainerReader&) = delete;
    ContainerReader& operator=(const ContainerReader&) = delete;

    // Fills up to len bytes; returns 0 only at end of content.
    std::size_t Read(std::uint8_t* out, std::size_t len);

    // Empty until the first non-empty Read.
    const std::optional<Header>& header() const noexcept { return header_; }

private:
    void ParseHeader();
    std::size_t ReadSource(std::uint8_t* out, std::size_t len);

    std::istream& source_;
    std::optional<Header> header_;
    std::size_t replay_pos_ = 0;
};

struct EncodeOptions {
    std::size_t leading_bytes = constants::kDefaultLeadingBytes;
    std::size_t chunk_size = constants::kStreamChunkSize;
    std::string filename;
    std::uint32_t checksum = 0;
};

struct DecodeResult {
    Header header;
    std::uint64_t content_size = 0;
    std::uint32_t checksum = 0;
};

std::uint64_t EncodeStream(std::istream& source,
                           std::ostream& dest,
                           const EncodeOptions& options,
                           crypto::RandomSource random = crypto::SystemRandom());

// Throws neo::Error(ChecksumMismatch) when the decoded content disagrees with the header.
DecodeResult DecodeStream(std::istream& source,
                          std::ostream& dest,
                          std::size_t chunk_size = constants::kStreamChunkSize);

// Reads at most the magic bytes from source.
bool LooksLikeContainer(std::istream& source);

}  // namespace neo::container
