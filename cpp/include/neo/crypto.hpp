#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace neo::crypto {

using Bytes = std::vector<std::uint8_t>;

// Supplies n random bytes; swapped out for a deterministic source in tests.
using RandomSource = std::function<Bytes(std::size_t)>;

Bytes RandomBytes(std::size_t size);
RandomSource SystemRandom();

class Crc32 {
public:
    void Update(const std::uint8_t* data, std::size_t len);
    void Update(const Bytes& data) { Update(data.data(), data.size()); }
    std::uint32_t Value() const noexcept { return value_; }
    void Reset() noexcept { value_ = 0; }

private:
    std::uint32_t value_ = 0;
};

std::uint32_t Crc32Of(const Bytes& data);

}  // namespace neo::crypto
