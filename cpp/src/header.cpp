#include "neo/header.hpp"

#include "neo/errors.hpp"
#include "neo/varint.hpp"
#include "neo/xor_stream.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace neo::header {

namespace {

using neo::constants::kChecksumLen;
using neo::constants::kFlagVersionMask;
using neo::constants::kMagic;
using neo::constants::kMinHeaderLen;
using neo::constants::kVersionV1;
using neo::constants::kXorKeyLen;

void PutU32Be(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint32_t GetU32Be(const std::uint8_t* ptr) {
    return (static_cast<std::uint32_t>(ptr[0]) << 24)
           | (static_cast<std::uint32_t>(ptr[1]) << 16)
           | (static_cast<std::uint32_t>(ptr[2]) << 8)
           | static_cast<std::uint32_t>(ptr[3]);
}

void CheckVersion(std::uint8_t version) {
    if (version != kVersionV1) {
        throw Error(ErrorKind::UnsupportedVersion, "version " + std::to_string(version));
    }
}

void CheckMethod(ObfMethod method) {
    if (method != ObfMethod::XorStream) {
        throw Error(ErrorKind::UnsupportedMethod,
                    "method tag " + std::to_string(static_cast<unsigned>(method)));
    }
}

void WriteXorBlock(Bytes& out, const std::uint8_t* content, std::size_t len, const Bytes& key) {
    out.push_back(static_cast<std::uint8_t>(ObfMethod::XorStream));
    varint::Append(out, key.size());
    out.insert(out.end(), key.begin(), key.end());
    varint::Append(out, len);
    std::size_t offset = out.size();
    out.resize(offset + len);
    obf::XorStream stream(key);
    stream.Apply(out.data() + offset, len, content, len);
}

// Bounds-checked view over the header body.
class Cursor {
public:
    Cursor(const std::uint8_t* data, std::size_t len) : data_(data), len_(len) {}

    std::uint8_t Byte() {
        Require(1);
        return data_[pos_++];
    }

    std::size_t Varint() {
        auto decoded = varint::Decode(data_ + pos_, len_ - pos_);
        pos_ += decoded.consumed;
        return decoded.value;
    }

    const std::uint8_t* Take(std::size_t n) {
        Require(n);
        const std::uint8_t* ptr = data_ + pos_;
        pos_ += n;
        return ptr;
    }

    std::size_t Remaining() const { return len_ - pos_; }

private:
    void Require(std::size_t n) const {
        if (n > len_ - pos_) {
            throw Error(ErrorKind::NotAContainer, "truncated header field");
        }
    }

    const std::uint8_t* data_;
    std::size_t len_;
    std::size_t pos_ = 0;
};

Bytes ReadXorBlock(Cursor& cursor) {
    std::size_t key_len = cursor.Varint();
    if (key_len == 0) {
        throw Error(ErrorKind::NotAContainer, "empty obfuscation key");
    }
    const std::uint8_t* key_ptr = cursor.Take(key_len);
    Bytes key(key_ptr, key_ptr + key_len);
    std::size_t content_len = cursor.Varint();
    const std::uint8_t* secret = cursor.Take(content_len);
    Bytes content(content_len);
    obf::XorStream stream(std::move(key));
    stream.Apply(content.data(), content.size(), secret, content_len);
    return content;
}

}  // namespace

bool operator==(const Header& lhs, const Header& rhs) {
    return lhs.version == rhs.version
           && lhs.original_header_method == rhs.original_header_method
           && lhs.original_header == rhs.original_header
           && lhs.original_filename_method == rhs.original_filename_method
           && lhs.original_filename == rhs.original_filename
           && lhs.checksum == rhs.checksum;
}

bool operator!=(const Header& lhs, const Header& rhs) {
    return !(lhs == rhs);
}

bool HasMagic(const std::uint8_t* data, std::size_t len) {
    return len >= kMagic.size() && std::equal(kMagic.begin(), kMagic.end(), data);
}

Bytes Serialize(const Header& header, const crypto::RandomSource& random) {
    CheckVersion(header.version);
    CheckMethod(header.original_header_method);
    CheckMethod(header.original_filename_method);

    Bytes body;
    body.reserve(1 + 2 * (1 + 1 + kXorKeyLen + 2) + header.original_header.size()
                 + header.original_filename.size() + kChecksumLen);
    body.push_back(static_cast<std::uint8_t>(header.version & kFlagVersionMask));

    WriteXorBlock(body, header.original_header.data(), header.original_header.size(), random(kXorKeyLen));
    WriteXorBlock(body,
                  reinterpret_cast<const std::uint8_t*>(header.original_filename.data()),
                  header.original_filename.size(),
                  random(kXorKeyLen));
    PutU32Be(body, header.checksum);

    Bytes out;
    out.reserve(kMagic.size() + varint::EncodedSize(body.size()) + body.size());
    out.insert(out.end(), kMagic.begin(), kMagic.end());
    varint::Append(out, body.size());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Bytes Serialize(const Header& header) {
    return Serialize(header, crypto::SystemRandom());
}

Header Parse(const std::uint8_t* data, std::size_t len) {
    if (len < kMinHeaderLen || !HasMagic(data, len)) {
        throw Error(ErrorKind::NotAContainer, "missing magic number");
    }
    auto body_len = varint::Decode(data + kMagic.size(), len - kMagic.size());
    std::size_t offset = kMagic.size() + body_len.consumed;
    if (len - offset != body_len.value) {
        throw Error(ErrorKind::HeaderLengthMismatch,
                    "declared " + std::to_string(body_len.value) + " bytes, got "
                        + std::to_string(len - offset));
    }

    Cursor cursor(data + offset, body_len.value);
    Header header;
    // top four flag bits are reserved
    header.version = cursor.Byte() & kFlagVersionMask;
    CheckVersion(header.version);

    header.original_header_method = static_cast<ObfMethod>(cursor.Byte());
    CheckMethod(header.original_header_method);
    header.original_header = ReadXorBlock(cursor);

    header.original_filename_method = static_cast<ObfMethod>(cursor.Byte());
    CheckMethod(header.original_filename_method);
    Bytes filename = ReadXorBlock(cursor);
    header.original_filename.assign(filename.begin(), filename.end());

    header.checksum = GetU32Be(cursor.Take(kChecksumLen));
    if (cursor.Remaining() != 0) {
        throw Error(ErrorKind::HeaderLengthMismatch,
                    std::to_string(cursor.Remaining()) + " trailing bytes after checksum");
    }
    return header;
}

Header Parse(const Bytes& data) {
    return Parse(data.data(), data.size());
}

}  // namespace neo::header
