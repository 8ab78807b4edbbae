#pragma once

#include "neo/constants.hpp"
#include "neo/crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace neo::header {

using Bytes = std::vector<std::uint8_t>;

enum class ObfMethod : std::uint8_t {
    XorStream = 1,
};

struct Header {
    std::uint8_t version = constants::kVersionV1;
    ObfMethod original_header_method = ObfMethod::XorStream;
    Bytes original_header;
    ObfMethod original_filename_method = ObfMethod::XorStream;
    std::string original_filename;
    std::uint32_t checksum = 0;
};

bool operator==(const Header& lhs, const Header& rhs);
bool operator!=(const Header& lhs, const Header& rhs);

// Wire layout:
//   magic(4) | varint body_len | flags(1) | header block | filename block | crc32 BE(4)
// where each block is method(1) | varint key_len | key | varint len | xor'd bytes.
// Every block gets a fresh kXorKeyLen-byte key from `random`.
Bytes Serialize(const Header& header, const crypto::RandomSource& random);
Bytes Serialize(const Header& header);

// Expects exactly one serialized header, nothing more.
Header Parse(const std::uint8_t* data, std::size_t len);
Header Parse(const Bytes& data);

bool HasMagic(const std::uint8_t* data, std::size_t len);

}  // namespace neo::header
