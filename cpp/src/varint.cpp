#include "neo/varint.hpp"

#include "neo/constants.hpp"
#include "neo/errors.hpp"

namespace neo::varint {

using neo::constants::kVarintBase;
using neo::constants::kVarintSentinel;

Bytes Encode(std::size_t value) {
    Bytes out;
    out.reserve(EncodedSize(value));
    Append(out, value);
    return out;
}

void Append(Bytes& out, std::size_t value) {
    out.insert(out.end(), value / kVarintBase, kVarintSentinel);
    out.push_back(static_cast<std::uint8_t>(value % kVarintBase));
}

std::size_t EncodedSize(std::size_t value) noexcept {
    return value / kVarintBase + 1;
}

Decoded Decode(const std::uint8_t* data, std::size_t len) {
    Decoded out;
    for (std::size_t i = 0; i < len; ++i) {
        if (data[i] == kVarintSentinel) {
            out.value += kVarintBase;
            continue;
        }
        out.value += data[i];
        out.consumed = i + 1;
        return out;
    }
    throw Error(ErrorKind::NotAContainer, "varint has no terminal byte");
}

Decoded Decode(const Bytes& data) {
    return Decode(data.data(), data.size());
}

}  // namespace neo::varint
