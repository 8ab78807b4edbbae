#pragma once

#include "neo/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace neo::filecodec {

struct FileOptions {
    std::size_t leading_bytes = constants::DefaultLeadingBytes();
    std::size_t chunk_size = constants::DefaultChunkSize();
};

std::uint32_t FileChecksum(const std::string& path, std::size_t chunk_size = constants::kStreamChunkSize);

// False for files shorter than the magic number.
bool IsContainerFile(const std::string& path);

// Writes <dir>/<random name>.neo next to path and returns its path. The input is kept.
std::string EncodeFile(const std::string& path, const FileOptions& options = {});

// Restores <dir>/<recorded filename> and returns its path. Nothing is left behind on failure.
std::string DecodeFile(const std::string& path, const FileOptions& options = {});

// Decodes containers, encodes everything else.
std::string ProcessFile(const std::string& path, const FileOptions& options = {});

}  // namespace neo::filecodec
