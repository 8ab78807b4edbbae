#include "neo/container.hpp"

#include "neo/errors.hpp"

#include <algorithm>
#include <array>
#include <istream>
#include <ostream>
#include <sstream>
#include <utility>

namespace neo::container {

namespace {

using neo::constants::kMagic;
using neo::constants::kVarintBase;
using neo::constants::kVarintSentinel;

std::string Hex32(std::uint32_t value) {
    std::ostringstream out;
    out << "0x" << std::hex << value;
    return out.str();
}

}  // namespace

ContainerWriter::ContainerWriter(std::ostream& sink,
                                 std::size_t leading_bytes,
                                 std::string filename,
                                 std::uint32_t checksum,
                                 crypto::RandomSource random)
    : sink_(sink), leading_bytes_(leading_bytes), random_(std::move(random)) {
    header_.original_filename = std::move(filename);
    header_.checksum = checksum;
    buffer_.reserve(leading_bytes_);
}

std::size_t ContainerWriter::Write(const std::uint8_t* data, std::size_t len) {
    if (header_written_) {
        WriteToSink(data, len);
        return len;
    }
    // compare against what is left of the buffer, not its target size
    std::size_t room = leading_bytes_ - buffer_.size();
    if (len < room) {
        buffer_.insert(buffer_.end(), data, data + len);
        return len;
    }
    buffer_.insert(buffer_.end(), data, data + room);
    FlushHeader();
    WriteToSink(data + room, len - room);
    return len;
}

void ContainerWriter::Close() {
    if (!header_written_) {
        FlushHeader();
    }
    sink_.flush();
    if (!sink_) {
        throw Error(ErrorKind::Io, "failed to flush container sink");
    }
}

void ContainerWriter::FlushHeader() {
    header_.original_header = std::move(buffer_);
    buffer_.clear();
    Bytes raw = header::Serialize(header_, random_);
    WriteToSink(raw.data(), raw.size());
    header_written_ = true;
}

void ContainerWriter::WriteToSink(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    sink_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!sink_) {
        throw Error(ErrorKind::Io, "failed to write container sink");
    }
}

ContainerReader::ContainerReader(std::istream& source) : source_(source) {}

std::size_t ContainerReader::Read(std::uint8_t* out, std::size_t len) {
    if (len == 0) {
        return 0;
    }
    if (!header_) {
        ParseHeader();
    }
    const Bytes& leading = header_->original_header;
    std::size_t replayed = 0;
    if (replay_pos_ < leading.size()) {
        replayed = std::min(len, leading.size() - replay_pos_);
        std::copy_n(leading.begin() + static_cast<std::ptrdiff_t>(replay_pos_), replayed, out);
        replay_pos_ += replayed;
        if (replayed == len) {
            return replayed;
        }
    }
    return replayed + ReadSource(out + replayed, len - replayed);
}

void ContainerReader::ParseHeader() {
    Bytes raw(kMagic.size());
    if (ReadSource(raw.data(), raw.size()) != raw.size() || !header::HasMagic(raw.data(), raw.size())) {
        throw Error(ErrorKind::NotAContainer, "missing magic number");
    }

    // The body length is self-delimiting, so it has to come off the source one byte at a time.
    std::size_t body_len = 0;
    for (;;) {
        int ch = source_.get();
        if (ch == std::char_traits<char>::eof()) {
            if (source_.bad()) {
                throw Error(ErrorKind::Io, "failed to read container source");
            }
            throw Error(ErrorKind::NotAContainer, "truncated header length");
        }
        auto byte = static_cast<std::uint8_t>(ch);
        raw.push_back(byte);
        if (byte != kVarintSentinel) {
            body_len += byte;
            break;
        }
        body_len += kVarintBase;
    }

    std::size_t prefix_len = raw.size();
    raw.resize(prefix_len + body_len);
    if (ReadSource(raw.data() + prefix_len, body_len) != body_len) {
        throw Error(ErrorKind::NotAContainer, "truncated header body");
    }
    header_ = header::Parse(raw);
    replay_pos_ = 0;
}

std::size_t ContainerReader::ReadSource(std::uint8_t* out, std::size_t len) {
    if (source_.bad()) {
        throw Error(ErrorKind::Io, "failed to read container source");
    }
    if (len == 0 || !source_) {
        return 0;
    }
    source_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(len));
    if (source_.bad()) {
        throw Error(ErrorKind::Io, "failed to read container source");
    }
    return static_cast<std::size_t>(source_.gcount());
}

std::uint64_t EncodeStream(std::istream& source,
                           std::ostream& dest,
                           const EncodeOptions& options,
                           crypto::RandomSource random) {
    std::size_t chunk = options.chunk_size > 0 ? options.chunk_size : constants::kStreamChunkSize;
    ContainerWriter writer(dest, options.leading_bytes, options.filename, options.checksum, std::move(random));
    std::uint64_t total = 0;

    std::vector<std::uint8_t> buffer(chunk);
    while (source) {
        source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = source.gcount();
        if (source.bad()) {
            throw Error(ErrorKind::Io, "failed to read encode source");
        }
        if (got <= 0) {
            break;
        }
        writer.Write(buffer.data(), static_cast<std::size_t>(got));
        total += static_cast<std::uint64_t>(got);
    }
    writer.Close();
    return total;
}

DecodeResult DecodeStream(std::istream& source, std::ostream& dest, std::size_t chunk_size) {
    std::size_t chunk = chunk_size > 0 ? chunk_size : constants::kStreamChunkSize;
    ContainerReader reader(source);
    crypto::Crc32 crc;
    DecodeResult result;

    std::vector<std::uint8_t> buffer(chunk);
    for (;;) {
        std::size_t got = reader.Read(buffer.data(), buffer.size());
        if (got == 0) {
            break;
        }
        crc.Update(buffer.data(), got);
        dest.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(got));
        if (!dest) {
            throw Error(ErrorKind::Io, "failed to write decoded content");
        }
        result.content_size += static_cast<std::uint64_t>(got);
    }
    dest.flush();
    if (!dest) {
        throw Error(ErrorKind::Io, "failed to flush decoded content");
    }

    result.header = *reader.header();
    result.checksum = crc.Value();
    if (result.checksum != result.header.checksum) {
        throw Error(ErrorKind::ChecksumMismatch,
                    "expected " + Hex32(result.header.checksum) + ", computed " + Hex32(result.checksum));
    }
    return result;
}

bool LooksLikeContainer(std::istream& source) {
    std::array<std::uint8_t, kMagic.size()> head{};
    source.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    if (source.bad()) {
        throw Error(ErrorKind::Io, "failed to read magic number");
    }
    auto got = static_cast<std::size_t>(source.gcount());
    return header::HasMagic(head.data(), got);
}

}  // namespace neo::container
