#pragma once

#include <cstddef>
#include <cstdint>
#include <huewire/color.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace huewire
{

// Manufacturer-specific Zigbee cluster that carries light update messages.
inline constexpr uint16_t HUE_LIGHT_CLUSTER_ID  = 0xFC03;
inline constexpr uint16_t HUE_MANUFACTURER_CODE = 0x100B;

// ─── Flag word bits ─────────────────────────────────────────────────────────
// Bit order differs from wire order: GRADIENT_COLORS (bit 8) is written
// before EFFECT_SPEED (bit 7) and GRADIENT_PARAMS (bit 6).

inline constexpr uint16_t FLAG_ON_OFF          = 1u << 0;
inline constexpr uint16_t FLAG_BRIGHTNESS      = 1u << 1;
inline constexpr uint16_t FLAG_COLOR_MIRED     = 1u << 2;
inline constexpr uint16_t FLAG_COLOR_XY        = 1u << 3;
inline constexpr uint16_t FLAG_TRANSITION_TIME = 1u << 4;
inline constexpr uint16_t FLAG_EFFECT          = 1u << 5;
inline constexpr uint16_t FLAG_GRADIENT_PARAMS = 1u << 6;
inline constexpr uint16_t FLAG_EFFECT_SPEED    = 1u << 7;
inline constexpr uint16_t FLAG_GRADIENT_COLORS = 1u << 8;

inline constexpr uint16_t FLAG_KNOWN_MASK = 0x01FF;

inline constexpr uint8_t BRIGHTNESS_MIN        = 1;
inline constexpr uint8_t BRIGHTNESS_MAX        = 254;
inline constexpr size_t  MAX_GRADIENT_COLORS   = 15;
inline constexpr size_t  GRADIENT_HEADER_SIZE  = 4;  // count, style, 2 reserved

// Built-in light effects. The wire carries a raw byte, so values outside this
// list can still appear in a decoded message.
enum class Effect : uint8_t
{
    Candle     = 0x01,
    Fireplace  = 0x02,
    Prism      = 0x03,
    Sunrise    = 0x09,
    Sparkle    = 0x0A,
    Opal       = 0x0B,
    Glisten    = 0x0C,
    Sunset     = 0x0D,
    Underwater = 0x0E,
    Cosmos     = 0x0F,
    Sunbeam    = 0x10,
    Enchant    = 0x11,
};

enum class GradientStyle : uint8_t
{
    Linear    = 0x00,
    Scattered = 0x02,
    Mirrored  = 0x04,
};

// True for the codes listed in Effect.
bool is_known_effect(uint8_t code);

// "candle", "sunset", ... or "unknown(0x42)".
std::string effect_name(Effect effect);

// "linear", "scattered", "mirrored" or "unknown(0x07)".
std::string gradient_style_name(GradientStyle style);

// Custom gradient for light strips. Colors are carried on the wire in the
// 12-bit scaled form, so they come back quantized.
struct Gradient
{
    GradientStyle        style = GradientStyle::Linear;
    std::vector<ColorXY> colors;

    bool operator==(const Gradient&) const = default;
};

// Both values lie in [0, 31.875] in steps of 0.125.
struct GradientParams
{
    // Number of colors that fit on the strip; ignored by the scattered style.
    // 0 blends all colors across the whole strip.
    double scale = 0.0;
    // Number of lights to skip at the start of the strip.
    double offset = 0.0;

    bool operator==(const GradientParams&) const = default;
};

// Combined light state update. Absent fields are left untouched on the
// device and take no space on the wire.
struct LightUpdateMessage
{
    std::optional<bool>           is_on;
    std::optional<uint8_t>        brightness;         // 1 (dimmest) .. 254
    std::optional<ColorMired>     color_temperature;
    std::optional<ColorXY>        color_xy;
    std::optional<uint16_t>       transition_time;    // 0 = instant
    std::optional<Effect>         effect;
    std::optional<uint8_t>        effect_speed;       // 0 (slowest) .. 255
    std::optional<Gradient>       gradient;
    std::optional<GradientParams> gradient_params;

    bool operator==(const LightUpdateMessage&) const = default;

    bool empty() const;
};

// Single-line human readable rendering, e.g.
// "LightUpdateMessage{on=true, brightness=46, effect=cosmos}".
std::string describe(const LightUpdateMessage& msg);

}  // namespace huewire
