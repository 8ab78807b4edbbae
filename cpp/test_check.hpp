#pragma once

#include "neo/crypto.hpp"
#include "neo/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

namespace neo::test {

inline int& Failures() {
    static int failures = 0;
    return failures;
}

inline void Check(bool ok, const std::string& what) {
    std::cout << "  " << what << ": " << (ok ? "ok" : "FAILED") << std::endl;
    if (!ok) {
        ++Failures();
    }
}

// True when fn throws neo::Error of the given kind.
template <typename Fn>
bool ThrowsKind(Fn&& fn, ErrorKind kind) {
    try {
        fn();
    } catch (const Error& exc) {
        if (exc.kind() != kind) {
            std::cout << "    unexpected error: " << exc.what() << std::endl;
        }
        return exc.kind() == kind;
    } catch (const std::exception& exc) {
        std::cout << "    unexpected exception: " << exc.what() << std::endl;
        return false;
    }
    return false;
}

// Deterministic key material so two encodings can be compared byte for byte.
inline crypto::RandomSource CountingRandom(std::uint8_t seed = 0x5A) {
    return [seed](std::size_t size) mutable {
        crypto::Bytes out(size);
        for (auto& byte : out) {
            byte = seed;
            seed = static_cast<std::uint8_t>(seed * 37 + 11);
        }
        return out;
    };
}

inline crypto::Bytes PatternBytes(std::size_t size, std::uint8_t salt = 0) {
    crypto::Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>((i * 131 + 7 + salt) & 0xFF);
    }
    return out;
}

inline int Finish(const char* suite) {
    if (Failures() == 0) {
        std::cout << suite << ": all checks passed" << std::endl;
        return 0;
    }
    std::cout << suite << ": " << Failures() << " check(s) failed" << std::endl;
    return 1;
}

}  // namespace neo::test
