#include <gtest/gtest.h>

#include <huewire/message.hpp>
#include <string>

using namespace huewire;

TEST(Message, KnownEffects)
{
    for (uint8_t code : {0x01, 0x02, 0x03, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x10, 0x11})
        EXPECT_TRUE(is_known_effect(code)) << static_cast<int>(code);

    for (uint8_t code : {0x00, 0x04, 0x08, 0x12, 0xFF})
        EXPECT_FALSE(is_known_effect(code)) << static_cast<int>(code);
}

TEST(Message, EffectNames)
{
    EXPECT_EQ(effect_name(Effect::Candle), "candle");
    EXPECT_EQ(effect_name(Effect::Cosmos), "cosmos");
    EXPECT_EQ(effect_name(Effect::Enchant), "enchant");
    EXPECT_EQ(effect_name(static_cast<Effect>(0x42)), "unknown(0x42)");
}

TEST(Message, GradientStyleNames)
{
    EXPECT_EQ(gradient_style_name(GradientStyle::Linear), "linear");
    EXPECT_EQ(gradient_style_name(GradientStyle::Scattered), "scattered");
    EXPECT_EQ(gradient_style_name(GradientStyle::Mirrored), "mirrored");
    EXPECT_EQ(gradient_style_name(static_cast<GradientStyle>(7)), "unknown(0x07)");
}

TEST(Message, EmptyTracksEveryField)
{
    LightUpdateMessage msg;
    EXPECT_TRUE(msg.empty());

    msg.gradient_params = GradientParams{};
    EXPECT_FALSE(msg.empty());

    LightUpdateMessage other;
    other.is_on = false;
    EXPECT_FALSE(other.empty());
}

TEST(Message, EqualityDistinguishesAbsentFromZero)
{
    LightUpdateMessage a;
    LightUpdateMessage b;
    b.transition_time = 0;
    EXPECT_NE(a, b);

    a.transition_time = 0;
    EXPECT_EQ(a, b);
}

TEST(Message, DescribeListsPresentFields)
{
    LightUpdateMessage msg;
    EXPECT_EQ(describe(msg), "LightUpdateMessage{}");

    msg.is_on        = true;
    msg.brightness   = 46;
    msg.effect       = Effect::Cosmos;
    msg.effect_speed = 127;
    EXPECT_EQ(describe(msg), "LightUpdateMessage{on=true, brightness=46, effect=cosmos, effect_speed=127}");
}

TEST(Message, DescribeGradient)
{
    LightUpdateMessage msg;
    msg.gradient        = Gradient{GradientStyle::Scattered, {ColorXY{0.5, 0.25}}};
    msg.gradient_params = GradientParams{2.5, 1};

    std::string text = describe(msg);
    EXPECT_NE(text.find("gradient=scattered[(0.5, 0.25)]"), std::string::npos) << text;
    EXPECT_NE(text.find("gradient_params=scale 2.5 offset 1"), std::string::npos) << text;
}

TEST(Message, ClusterConstants)
{
    EXPECT_EQ(HUE_LIGHT_CLUSTER_ID, 0xFC03);
    EXPECT_EQ(HUE_MANUFACTURER_CODE, 0x100B);
    EXPECT_EQ(FLAG_KNOWN_MASK,
              FLAG_ON_OFF | FLAG_BRIGHTNESS | FLAG_COLOR_MIRED | FLAG_COLOR_XY | FLAG_TRANSITION_TIME
                  | FLAG_EFFECT | FLAG_GRADIENT_PARAMS | FLAG_EFFECT_SPEED | FLAG_GRADIENT_COLORS);
}
