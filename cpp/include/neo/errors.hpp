#pragma once

#include <stdexcept>
#include <string>

namespace neo {

enum class ErrorKind {
    UnsupportedVersion,
    UnsupportedMethod,
    NotAContainer,
    HeaderLengthMismatch,
    ChecksumMismatch,
    ShortBuffer,
    Io,
};

const char* ErrorKindName(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace neo
