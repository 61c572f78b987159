#include <algorithm>
#include <cmath>
#include <huewire/color.hpp>
#include <huewire/errors.hpp>
#include <string>

namespace huewire
{

// ─── ColorXYScaled packing ──────────────────────────────────────────────────

std::array<uint8_t, ColorXYScaled::WIRE_SIZE> ColorXYScaled::to_bytes() const
{
    return {
        static_cast<uint8_t>(x & 0x0FF),
        static_cast<uint8_t>(((x & 0xF00) >> 8) | ((y & 0x00F) << 4)),
        static_cast<uint8_t>((y & 0xFF0) >> 4),
    };
}

ColorXYScaled ColorXYScaled::from_bytes(std::span<const uint8_t> data)
{
    if (data.size() != WIRE_SIZE)
        throw LengthError("scaled color needs exactly " + std::to_string(WIRE_SIZE)
                          + " bytes, got " + std::to_string(data.size()));

    const uint8_t a = data[0];
    const uint8_t b = data[1];
    const uint8_t c = data[2];
    return ColorXYScaled{static_cast<uint16_t>(((b & 0x0F) << 8) | a),
                         static_cast<uint16_t>((c << 4) | (b >> 4))};
}

// ─── Normalized <-> scaled ──────────────────────────────────────────────────

// Absorbs the rounding from_scaled() leaves behind, so decoded grid points
// re-encode to the same step.
static constexpr double GRID_EPSILON = 1e-9;

static uint16_t scale_axis(double v, double axis_max, const char* axis)
{
    if (!std::isfinite(v))
        throw RangeError(std::string("gradient color ") + axis + " is not a finite number");
    const double unit = std::clamp(v / axis_max, 0.0, 1.0);
    return static_cast<uint16_t>(ColorXYScaled::MAX_VALUE * unit + GRID_EPSILON);
}

ColorXYScaled to_scaled(const ColorXY& color)
{
    return ColorXYScaled{scale_axis(color.x, ColorXYScaled::MAX_X, "x"),
                         scale_axis(color.y, ColorXYScaled::MAX_Y, "y")};
}

ColorXY from_scaled(const ColorXYScaled& scaled)
{
    const double max = ColorXYScaled::MAX_VALUE;
    return ColorXY{(scaled.x / max) * ColorXYScaled::MAX_X, (scaled.y / max) * ColorXYScaled::MAX_Y};
}

// ─── Mired ──────────────────────────────────────────────────────────────────

ColorMired ColorMired::from_kelvin(double kelvin)
{
    if (!std::isfinite(kelvin) || kelvin <= 0.0)
        throw RangeError("kelvin must be a positive number");
    const double mired = std::floor(1'000'000.0 / kelvin);
    if (mired > 0xFFFF)
        throw RangeError("kelvin " + std::to_string(kelvin) + " is below the 16-bit mired range");
    return ColorMired{static_cast<uint16_t>(mired)};
}

// ─── Gradient params ────────────────────────────────────────────────────────

uint8_t encode_gradient_param(double value, GradientParamRounding rounding)
{
    if (!std::isfinite(value) || value < 0.0 || value > GRADIENT_PARAM_MAX)
        throw RangeError("gradient parameter " + std::to_string(value) + " outside [0, "
                         + std::to_string(GRADIENT_PARAM_MAX) + "]");

    const double raw = value / GRADIENT_PARAM_STEP;
    if (rounding == GradientParamRounding::Reject && raw != std::floor(raw))
        throw RangeError("gradient parameter " + std::to_string(value)
                         + " is not a multiple of 0.125");
    return static_cast<uint8_t>(raw);
}

}  // namespace huewire
