#include <huewire/huewire.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace huewire;

// Decode hex frames given on the command line (or a few captured samples),
// using the codec policy and logging setup from the user's config file.
int main(int argc, char** argv)
{
    CodecConfig cfg;
    const std::string path = CodecConfig::default_path();
    if (!cfg.load(path))
        std::cerr << "using default configuration (" << path << " not loaded)\n";
    cfg.apply_logging();

    HUEWIRE_LOG_INFO("decode_frames",
                     "strict_effects={} reject_unknown_flags={}",
                     cfg.options().strict_effects,
                     cfg.options().reject_unknown_flags);

    std::vector<std::string> frames;
    for (int i = 1; i < argc; ++i)
        frames.emplace_back(argv[i]);
    if (frames.empty())
        frames = {"ab00012e6f2f40100f7f", "19000132518f530400", "1100000800", "0200"};

    int failures = 0;
    for (const auto& hex : frames)
    {
        std::vector<uint8_t> bytes;
        try
        {
            bytes = hex_to_bytes(hex);
        }
        catch (const FormatError& e)
        {
            HUEWIRE_LOG_ERROR("decode_frames", "bad hex '{}': {}", hex, e.what());
            ++failures;
            continue;
        }

        auto msg = try_decode_message(bytes, cfg.options());
        if (!msg)
        {
            std::cout << hex << "  -> rejected\n";
            ++failures;
            continue;
        }
        std::cout << hex << "  -> " << describe(*msg) << '\n';
    }

    return failures == 0 ? 0 : 1;
}
