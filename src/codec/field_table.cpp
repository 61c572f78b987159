#include "field_table.hpp"

#include <array>
#include <cmath>
#include <huewire/color.hpp>
#include <huewire/errors.hpp>
#include <string>
#include <utility>

namespace huewire::detail
{

// Plain XY travels as u16 fractions of 0xFFFF.
static constexpr double UNIT_SCALE = 65535.0;

static uint16_t quantize_unit(double v, const char* what)
{
    if (!std::isfinite(v))
        throw RangeError(std::string(what) + " is not a finite number");
    if (v < 0.0)
        v = 0.0;
    else if (v > 1.0)
        v = 1.0;
    return static_cast<uint16_t>(v * UNIT_SCALE);
}

// ─── on/off ─────────────────────────────────────────────────────────────────

static bool has_on_off(const LightUpdateMessage& m) { return m.is_on.has_value(); }

static void encode_on_off(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    out.put_u8(*m.is_on ? 1 : 0);
}

static void decode_on_off(wire::ByteReader&   in,
                          const char*         name,
                          LightUpdateMessage& m,
                          const CodecOptions&)
{
    m.is_on = in.get_u8(name) != 0;
}

// ─── brightness ─────────────────────────────────────────────────────────────

static bool has_brightness(const LightUpdateMessage& m) { return m.brightness.has_value(); }

static void encode_brightness(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    const uint8_t v = *m.brightness;
    if (v < BRIGHTNESS_MIN || v > BRIGHTNESS_MAX)
        throw RangeError("brightness " + std::to_string(v) + " outside ["
                         + std::to_string(BRIGHTNESS_MIN) + ", " + std::to_string(BRIGHTNESS_MAX)
                         + "]");
    out.put_u8(v);
}

// Decoding stays permissive: 0 and 255 are wire-legal.
static void decode_brightness(wire::ByteReader&   in,
                              const char*         name,
                              LightUpdateMessage& m,
                              const CodecOptions&)
{
    m.brightness = in.get_u8(name);
}

// ─── color temperature ──────────────────────────────────────────────────────

static bool has_color_mired(const LightUpdateMessage& m) { return m.color_temperature.has_value(); }

static void encode_color_mired(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    out.put_u16_le(m.color_temperature->mired);
}

static void decode_color_mired(wire::ByteReader&   in,
                               const char*         name,
                               LightUpdateMessage& m,
                               const CodecOptions&)
{
    m.color_temperature = ColorMired{in.get_u16_le(name)};
}

// ─── color xy ───────────────────────────────────────────────────────────────

static bool has_color_xy(const LightUpdateMessage& m) { return m.color_xy.has_value(); }

static void encode_color_xy(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    out.put_u16_le(quantize_unit(m.color_xy->x, "color_xy.x"));
    out.put_u16_le(quantize_unit(m.color_xy->y, "color_xy.y"));
}

static void decode_color_xy(wire::ByteReader&   in,
                            const char*         name,
                            LightUpdateMessage& m,
                            const CodecOptions&)
{
    const double x = in.get_u16_le(name) / UNIT_SCALE;
    const double y = in.get_u16_le(name) / UNIT_SCALE;
    m.color_xy     = ColorXY{x, y};
}

// ─── transition time ────────────────────────────────────────────────────────

static bool has_transition(const LightUpdateMessage& m) { return m.transition_time.has_value(); }

static void encode_transition(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    out.put_u16_le(*m.transition_time);
}

static void decode_transition(wire::ByteReader&   in,
                              const char*         name,
                              LightUpdateMessage& m,
                              const CodecOptions&)
{
    m.transition_time = in.get_u16_le(name);
}

// ─── effect ─────────────────────────────────────────────────────────────────

static bool has_effect(const LightUpdateMessage& m) { return m.effect.has_value(); }

static void encode_effect(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    out.put_u8(static_cast<uint8_t>(*m.effect));
}

static void decode_effect(wire::ByteReader&   in,
                          const char*         name,
                          LightUpdateMessage& m,
                          const CodecOptions& opts)
{
    const uint8_t code = in.get_u8(name);
    if (opts.strict_effects && !is_known_effect(code))
        throw FormatError("unknown effect code " + std::to_string(code));
    m.effect = static_cast<Effect>(code);
}

// ─── gradient colors ────────────────────────────────────────────────────────
// [size][count << 4][style][0][0][3 bytes per color], size = 4 + 3 * count.

static bool has_gradient(const LightUpdateMessage& m) { return m.gradient.has_value(); }

static size_t gradient_size(const LightUpdateMessage& m)
{
    return 1 + GRADIENT_HEADER_SIZE + ColorXYScaled::WIRE_SIZE * m.gradient->colors.size();
}

static void encode_gradient(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    const Gradient& g     = *m.gradient;
    const size_t    count = g.colors.size();
    if (count > MAX_GRADIENT_COLORS)
        throw RangeError("gradient has " + std::to_string(count) + " colors, at most "
                         + std::to_string(MAX_GRADIENT_COLORS) + " fit");

    out.put_u8(static_cast<uint8_t>(GRADIENT_HEADER_SIZE + ColorXYScaled::WIRE_SIZE * count));
    out.put_u8(static_cast<uint8_t>(count << 4));
    out.put_u8(static_cast<uint8_t>(g.style));
    out.skip(2);  // reserved
    for (const auto& color : g.colors)
        out.put_bytes(to_scaled(color).to_bytes());
}

static void decode_gradient(wire::ByteReader&   in,
                            const char*         name,
                            LightUpdateMessage& m,
                            const CodecOptions&)
{
    const size_t start = in.position();
    const size_t size  = in.get_u8(name);
    if (size < GRADIENT_HEADER_SIZE)
        throw FormatError(std::string(name) + " block at offset " + std::to_string(start) + ": size="
                          + std::to_string(size) + " too small, expected at least "
                          + std::to_string(GRADIENT_HEADER_SIZE));
    if (size > in.remaining())
        throw FormatError(std::string(name) + " block at offset " + std::to_string(start) + ": size="
                          + std::to_string(size) + " extends beyond end of data ("
                          + std::to_string(in.remaining()) + " byte(s) left)");

    auto block = in.take(size, name);

    const size_t count      = block[0] >> 4;
    const size_t colors_end = GRADIENT_HEADER_SIZE + ColorXYScaled::WIRE_SIZE * count;
    if (colors_end > size)
        throw FormatError(std::string(name) + " block at offset " + std::to_string(start)
                          + ": not enough data, " + std::to_string(count) + " colors need "
                          + std::to_string(colors_end) + " bytes but size=" + std::to_string(size));

    Gradient g;
    g.style = static_cast<GradientStyle>(block[1]);
    g.colors.reserve(count);
    for (size_t off = GRADIENT_HEADER_SIZE; off < colors_end; off += ColorXYScaled::WIRE_SIZE)
        g.colors.push_back(
            from_scaled(ColorXYScaled::from_bytes(block.subspan(off, ColorXYScaled::WIRE_SIZE))));

    // Bytes between colors_end and size are skipped.
    m.gradient = std::move(g);
}

// ─── effect speed ───────────────────────────────────────────────────────────

static bool has_effect_speed(const LightUpdateMessage& m) { return m.effect_speed.has_value(); }

static void encode_effect_speed(const LightUpdateMessage& m, wire::ByteWriter& out, const CodecOptions&)
{
    out.put_u8(*m.effect_speed);
}

static void decode_effect_speed(wire::ByteReader&   in,
                                const char*         name,
                                LightUpdateMessage& m,
                                const CodecOptions&)
{
    m.effect_speed = in.get_u8(name);
}

// ─── gradient params ────────────────────────────────────────────────────────

static bool has_gradient_params(const LightUpdateMessage& m) { return m.gradient_params.has_value(); }

static void encode_gradient_params(const LightUpdateMessage& m,
                                   wire::ByteWriter&         out,
                                   const CodecOptions&       opts)
{
    out.put_u8(encode_gradient_param(m.gradient_params->scale, opts.gradient_param_rounding));
    out.put_u8(encode_gradient_param(m.gradient_params->offset, opts.gradient_param_rounding));
}

static void decode_gradient_params(wire::ByteReader&   in,
                                   const char*         name,
                                   LightUpdateMessage& m,
                                   const CodecOptions&)
{
    GradientParams p;
    p.scale           = decode_gradient_param(in.get_u8(name));
    p.offset          = decode_gradient_param(in.get_u8(name));
    m.gradient_params = p;
}

// ─── Table ──────────────────────────────────────────────────────────────────

// clang-format off
static const std::array<FieldSpec, 9> FIELDS = {{
    {FLAG_ON_OFF,          "on_off",          1, has_on_off,          nullptr,       encode_on_off,          decode_on_off},
    {FLAG_BRIGHTNESS,      "brightness",      1, has_brightness,      nullptr,       encode_brightness,      decode_brightness},
    {FLAG_COLOR_MIRED,     "color_mired",     2, has_color_mired,     nullptr,       encode_color_mired,     decode_color_mired},
    {FLAG_COLOR_XY,        "color_xy",        4, has_color_xy,        nullptr,       encode_color_xy,        decode_color_xy},
    {FLAG_TRANSITION_TIME, "transition_time", 2, has_transition,      nullptr,       encode_transition,      decode_transition},
    {FLAG_EFFECT,          "effect",          1, has_effect,          nullptr,       encode_effect,          decode_effect},
    {FLAG_GRADIENT_COLORS, "gradient_colors", 0, has_gradient,        gradient_size, encode_gradient,        decode_gradient},
    {FLAG_EFFECT_SPEED,    "effect_speed",    1, has_effect_speed,    nullptr,       encode_effect_speed,    decode_effect_speed},
    {FLAG_GRADIENT_PARAMS, "gradient_params", 2, has_gradient_params, nullptr,       encode_gradient_params, decode_gradient_params},
}};
// clang-format on

std::span<const FieldSpec> field_table()
{
    return FIELDS;
}

}  // namespace huewire::detail
