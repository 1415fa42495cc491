#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxcall {

// Standard alphabet, '=' padding. Whitespace is skipped; any other
// character outside the alphabet makes the input invalid.
std::optional<std::vector<std::uint8_t>> base64Decode(const std::string& text);

std::string base64Encode(const std::vector<std::uint8_t>& bytes);

} // namespace voxcall
