#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace huewire
{

// CIE xy chromaticity, each coordinate normally in [0, 1].
struct ColorXY
{
    double x = 0.0;
    double y = 0.0;

    constexpr ColorXY() = default;
    constexpr ColorXY(double x, double y) : x(x), y(y) {}

    bool operator==(const ColorXY&) const = default;
};

// 12-bit-per-axis color used inside gradient blocks. The full 0..0xFFF range
// maps onto [0, MAX_X] and [0, MAX_Y] rather than [0, 1]; the maxima were
// measured on real devices.
struct ColorXYScaled
{
    static constexpr double   MAX_X     = 0.7347;
    static constexpr double   MAX_Y     = 0.8264;
    static constexpr uint16_t MAX_VALUE = 0x0FFF;
    static constexpr size_t   WIRE_SIZE = 3;

    uint16_t x = 0;
    uint16_t y = 0;

    constexpr ColorXYScaled() = default;
    constexpr ColorXYScaled(uint16_t x, uint16_t y) : x(x), y(y) {}

    bool operator==(const ColorXYScaled&) const = default;

    // [x low 8][x high 4 | y low 4 << 4][y high 8]. Bits above 12 are dropped.
    std::array<uint8_t, WIRE_SIZE> to_bytes() const;

    // Throws LengthError unless `data` is exactly WIRE_SIZE bytes.
    static ColorXYScaled from_bytes(std::span<const uint8_t> data);
};

// Clamp each axis to its device maximum and quantize (truncating) to 12 bits.
// Throws RangeError for NaN or infinite coordinates.
ColorXYScaled to_scaled(const ColorXY& color);

ColorXY from_scaled(const ColorXYScaled& scaled);

// Color temperature in mireds (1'000'000 / Kelvin).
struct ColorMired
{
    uint16_t mired = 0;

    constexpr ColorMired() = default;
    constexpr explicit ColorMired(uint16_t mired) : mired(mired) {}

    bool operator==(const ColorMired&) const = default;

    // floor(1'000'000 / kelvin). Throws RangeError if kelvin <= 0 or the
    // result does not fit in 16 bits.
    static ColorMired from_kelvin(double kelvin);
};

// Gradient scale/offset are fixed-point bytes holding value * 8.
inline constexpr double GRADIENT_PARAM_STEP = 0.125;
inline constexpr double GRADIENT_PARAM_MAX  = 255.0 * GRADIENT_PARAM_STEP;

enum class GradientParamRounding : uint8_t
{
    Reject   = 0,  // values off the 1/8 grid throw RangeError
    Truncate = 1,  // values off the 1/8 grid round toward zero
};

// Throws RangeError outside [0, GRADIENT_PARAM_MAX], or off-grid under Reject.
uint8_t encode_gradient_param(double value, GradientParamRounding rounding);

inline constexpr double decode_gradient_param(uint8_t raw)
{
    return static_cast<double>(raw) * GRADIENT_PARAM_STEP;
}

}  // namespace huewire
