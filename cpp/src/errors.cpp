#include "neo/errors.hpp"

namespace neo {

const char* ErrorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnsupportedVersion:
            return "unsupported version";
        case ErrorKind::UnsupportedMethod:
            return "unsupported obfuscation method";
        case ErrorKind::NotAContainer:
            return "not a container";
        case ErrorKind::HeaderLengthMismatch:
            return "header length mismatch";
        case ErrorKind::ChecksumMismatch:
            return "checksum mismatch";
        case ErrorKind::ShortBuffer:
            return "short buffer";
        case ErrorKind::Io:
            return "i/o error";
    }
    return "unknown error";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + message), kind_(kind) {}

}  // namespace neo
