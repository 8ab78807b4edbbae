#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace neo::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
// Positive integer from the environment; unset, zero or malformed values yield fallback.
std::size_t GetSize(std::string_view name, std::size_t fallback);

}  // namespace neo::env
