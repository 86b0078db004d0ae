#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meddictate {
namespace utils {

// Strict RFC 4648 decoding. Whitespace is skipped; any other foreign
// character or bad padding returns std::nullopt.
std::optional<std::vector<uint8_t>> base64Decode(const std::string& encoded);

std::string base64Encode(const std::vector<uint8_t>& data);

} // namespace utils
} // namespace meddictate
