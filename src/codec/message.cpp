#include <cstdio>
#include <huewire/message.hpp>
#include <sstream>

namespace huewire
{

static std::string unknown_code(uint8_t code)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "unknown(0x%02x)", static_cast<unsigned>(code));
    return buf;
}

bool is_known_effect(uint8_t code)
{
    switch (static_cast<Effect>(code))
    {
        case Effect::Candle:
        case Effect::Fireplace:
        case Effect::Prism:
        case Effect::Sunrise:
        case Effect::Sparkle:
        case Effect::Opal:
        case Effect::Glisten:
        case Effect::Sunset:
        case Effect::Underwater:
        case Effect::Cosmos:
        case Effect::Sunbeam:
        case Effect::Enchant:
            return true;
    }
    return false;
}

std::string effect_name(Effect effect)
{
    switch (effect)
    {
        case Effect::Candle:
            return "candle";
        case Effect::Fireplace:
            return "fireplace";
        case Effect::Prism:
            return "prism";
        case Effect::Sunrise:
            return "sunrise";
        case Effect::Sparkle:
            return "sparkle";
        case Effect::Opal:
            return "opal";
        case Effect::Glisten:
            return "glisten";
        case Effect::Sunset:
            return "sunset";
        case Effect::Underwater:
            return "underwater";
        case Effect::Cosmos:
            return "cosmos";
        case Effect::Sunbeam:
            return "sunbeam";
        case Effect::Enchant:
            return "enchant";
    }
    return unknown_code(static_cast<uint8_t>(effect));
}

std::string gradient_style_name(GradientStyle style)
{
    switch (style)
    {
        case GradientStyle::Linear:
            return "linear";
        case GradientStyle::Scattered:
            return "scattered";
        case GradientStyle::Mirrored:
            return "mirrored";
    }
    return unknown_code(static_cast<uint8_t>(style));
}

bool LightUpdateMessage::empty() const
{
    return !is_on && !brightness && !color_temperature && !color_xy && !transition_time && !effect
        && !effect_speed && !gradient && !gradient_params;
}

std::string describe(const LightUpdateMessage& msg)
{
    std::ostringstream os;
    const char*        sep   = "";
    auto               field = [&](const char* name) -> std::ostringstream&
    {
        os << sep << name << '=';
        sep = ", ";
        return os;
    };

    os << "LightUpdateMessage{";
    if (msg.is_on)
        field("on") << (*msg.is_on ? "true" : "false");
    if (msg.brightness)
        field("brightness") << static_cast<unsigned>(*msg.brightness);
    if (msg.color_temperature)
        field("mired") << msg.color_temperature->mired;
    if (msg.color_xy)
        field("xy") << '(' << msg.color_xy->x << ", " << msg.color_xy->y << ')';
    if (msg.transition_time)
        field("transition") << *msg.transition_time;
    if (msg.effect)
        field("effect") << effect_name(*msg.effect);
    if (msg.gradient)
    {
        field("gradient") << gradient_style_name(msg.gradient->style) << '[';
        for (size_t i = 0; i < msg.gradient->colors.size(); ++i)
        {
            const auto& c = msg.gradient->colors[i];
            os << (i ? ", " : "") << '(' << c.x << ", " << c.y << ')';
        }
        os << ']';
    }
    if (msg.effect_speed)
        field("effect_speed") << static_cast<unsigned>(*msg.effect_speed);
    if (msg.gradient_params)
        field("gradient_params") << "scale " << msg.gradient_params->scale << " offset "
                                 << msg.gradient_params->offset;
    os << '}';
    return os.str();
}

}  // namespace huewire
