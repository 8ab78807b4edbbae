#include "neo/crypto.hpp"

#include <openssl/rand.h>
#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace neo::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

RandomSource SystemRandom() {
    return [](std::size_t size) { return RandomBytes(size); };
}

void Crc32::Update(const std::uint8_t* data, std::size_t len) {
    // zlib takes uInt lengths
    constexpr std::size_t kMaxStep = std::numeric_limits<uInt>::max();
    while (len > 0) {
        std::size_t step = std::min(len, kMaxStep);
        value_ = static_cast<std::uint32_t>(crc32(value_, data, static_cast<uInt>(step)));
        data += step;
        len -= step;
    }
}

std::uint32_t Crc32Of(const Bytes& data) {
    Crc32 crc;
    crc.Update(data);
    return crc.Value();
}

}  // namespace neo::crypto
