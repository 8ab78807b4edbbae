#include "neo/xor_stream.hpp"

#include "neo/errors.hpp"

#include <stdexcept>
#include <utility>

namespace neo::obf {

XorStream::XorStream(Bytes key) : key_(std::move(key)) {
    if (key_.empty()) {
        throw std::invalid_argument("XOR stream key must not be empty");
    }
}

void XorStream::Apply(std::uint8_t* dst, std::size_t dst_len, const std::uint8_t* src, std::size_t src_len) {
    if (src_len == 0) {
        return;
    }
    if (dst_len < src_len) {
        throw Error(ErrorKind::ShortBuffer, "destination smaller than source");
    }
    const std::size_t key_len = key_.size();
    for (std::size_t i = 0; i < src_len; ++i) {
        dst[i] = static_cast<std::uint8_t>(src[i] ^ key_[static_cast<std::size_t>(position_ % key_len)]);
        ++position_;
    }
}

Bytes XorStream::Apply(const Bytes& src) {
    Bytes out(src.size());
    Apply(out.data(), out.size(), src.data(), src.size());
    return out;
}

void XorStream::ApplyInPlace(Bytes& buffer) {
    Apply(buffer.data(), buffer.size(), buffer.data(), buffer.size());
}

Bytes XorBytes(const Bytes& data, const Bytes& key) {
    XorStream stream(key);
    return stream.Apply(data);
}

}  // namespace neo::obf
