#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "neo/env.hpp"

namespace neo::constants {

inline constexpr std::array<std::uint8_t, 4> kMagic = {0xFF, 0x4E, 0x45, 0x4F};

inline constexpr std::uint8_t kVersionV1 = 1;
inline constexpr std::uint8_t kFlagVersionMask = 0x0F;

inline constexpr std::uint8_t kVarintSentinel = 0xFF;
inline constexpr std::size_t kVarintBase = 0xFF;

inline constexpr std::size_t kXorKeyLen = 4;
inline constexpr std::size_t kChecksumLen = 4;
// magic plus at least one varint byte
inline constexpr std::size_t kMinHeaderLen = 5;

inline constexpr std::size_t kDefaultLeadingBytes = 8;
inline constexpr std::size_t kStreamChunkSize = 64u * 1024u;
inline constexpr std::size_t kOutputNameLen = 8;

inline constexpr std::string_view kContainerExt = ".neo";
inline constexpr std::string_view kDecodingSuffix = ".decoding";

inline std::size_t DefaultLeadingBytes() {
    return neo::env::GetSize("NEO_LEADING_BYTES", kDefaultLeadingBytes);
}

inline std::size_t DefaultChunkSize() {
    return neo::env::GetSize("NEO_CHUNK_SIZE", kStreamChunkSize);
}

}  // namespace neo::constants
