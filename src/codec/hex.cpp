#include <huewire/errors.hpp>
#include <huewire/hex.hpp>

namespace huewire
{

static int hex_digit_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string bytes_to_hex(std::span<const uint8_t> bytes)
{
    static const char* digits = "0123456789abcdef";
    std::string        out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes)
    {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> hex_to_bytes(std::string_view hex)
{
    if (hex.size() % 2 != 0)
        throw FormatError("hex string has odd length " + std::to_string(hex.size()));

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const int hi = hex_digit_value(hex[i]);
        const int lo = hex_digit_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
            throw FormatError("invalid hex character at position "
                              + std::to_string(hi < 0 ? i : i + 1));
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace huewire
