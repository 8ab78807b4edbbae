#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace neo::varint {

using Bytes = std::vector<std::uint8_t>;

// Base-255 integers: floor(value / 255) bytes of 0xFF followed by value % 255.
Bytes Encode(std::size_t value);
void Append(Bytes& out, std::size_t value);
std::size_t EncodedSize(std::size_t value) noexcept;

struct Decoded {
    std::size_t value = 0;
    std::size_t consumed = 0;
};

// Throws neo::Error(NotAContainer) if the input ends before a terminal byte.
Decoded Decode(const std::uint8_t* data, std::size_t len);
Decoded Decode(const Bytes& data);

}  // namespace neo::varint
