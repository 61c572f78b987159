#include <huewire/huewire.hpp>
#include <iostream>

using namespace huewire;

static void show(const char* title, const LightUpdateMessage& msg)
{
    auto bytes = encode_message(msg);
    std::cout << title << '\n';
    std::cout << "  " << describe(msg) << '\n';
    std::cout << "  " << bytes.size() << " bytes: " << bytes_to_hex(bytes) << "\n\n";
}

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Warm white at 80%, fading over 0.4s
    LightUpdateMessage warm;
    warm.is_on             = true;
    warm.brightness        = 203;
    warm.color_temperature = ColorMired::from_kelvin(2700);
    warm.transition_time   = 4;
    show("warm white", warm);

    // Candle effect, slow
    LightUpdateMessage candle;
    candle.is_on        = true;
    candle.effect       = Effect::Candle;
    candle.effect_speed = 40;
    show("candle", candle);

    // Three-stop mirrored gradient for a light strip
    LightUpdateMessage strip;
    strip.is_on    = true;
    strip.gradient = Gradient{GradientStyle::Mirrored,
                              {ColorXY{0.6915, 0.3083}, ColorXY{0.1532, 0.0475}, ColorXY{0.17, 0.7}}};
    strip.gradient_params = GradientParams{2.0, 0.5};
    show("gradient", strip);

    // Decoding the strip message back gives quantized colors
    auto back = decode_message(encode_message(strip));
    std::cout << "decoded: " << describe(back) << '\n';

    try
    {
        LightUpdateMessage bad;
        bad.brightness = 255;
        encode_message(bad);
    }
    catch (const RangeError& e)
    {
        HUEWIRE_LOG_ERROR("demo", "encode refused: {}", e.what());
    }

    return 0;
}
