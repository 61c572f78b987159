#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace huewire
{

// Two lowercase hex digits per byte: {0x01, 0xFE} -> "01fe".
std::string bytes_to_hex(std::span<const uint8_t> bytes);

// Inverse of bytes_to_hex(); upper-case digits are accepted.
// Throws FormatError on odd length or any non-hex character.
std::vector<uint8_t> hex_to_bytes(std::string_view hex);

}  // namespace huewire
