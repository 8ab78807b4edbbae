#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace neo::obf {

using Bytes = std::vector<std::uint8_t>;

// Repeating-key XOR over a running byte position. Applying the same key from the
// same position twice restores the input. This hides header fields from casual
// inspection only; the key travels in clear next to the payload.
class XorStream {
public:
    explicit XorStream(Bytes key);

    // dst may alias src. Throws neo::Error(ShortBuffer) when dst_len < src_len.
    void Apply(std::uint8_t* dst, std::size_t dst_len, const std::uint8_t* src, std::size_t src_len);
    Bytes Apply(const Bytes& src);
    void ApplyInPlace(Bytes& buffer);

    void Reset() noexcept { position_ = 0; }
    std::uint64_t position() const noexcept { return position_; }
    const Bytes& key() const noexcept { return key_; }

private:
    Bytes key_;
    std::uint64_t position_ = 0;
};

Bytes XorBytes(const Bytes& data, const Bytes& key);

}  // namespace neo::obf
