#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <huewire/config.hpp>
#include <huewire/logger.hpp>
#include <string>

using namespace huewire;

namespace fs = std::filesystem;

// Restores global logger state touched by apply_logging().
class CodecConfigTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path()
               / ("huewire_config_test_"
                  + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
    }

    void TearDown() override
    {
        fs::remove_all(dir_);
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }

    fs::path dir_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Defaults and serialization
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CodecConfigTest, Defaults)
{
    CodecConfig cfg;
    EXPECT_EQ(cfg.options(), CodecOptions{});
    EXPECT_FALSE(cfg.options().reject_unknown_flags);
    EXPECT_FALSE(cfg.options().strict_effects);
    EXPECT_EQ(cfg.options().gradient_param_rounding, GradientParamRounding::Reject);
    EXPECT_EQ(cfg.log_level(), LogLevel::Info);
    EXPECT_TRUE(cfg.log_file().empty());
}

TEST_F(CodecConfigTest, SerializeContainsVersionAndSections)
{
    CodecConfig cfg;
    std::string json = cfg.serialize();
    EXPECT_NE(json.find("\"version\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"codec\""), std::string::npos);
    EXPECT_NE(json.find("\"gradient_param_rounding\": \"reject\""), std::string::npos);
    EXPECT_NE(json.find("\"level\": \"info\""), std::string::npos);
}

TEST_F(CodecConfigTest, SerializeDeserializeRoundTrip)
{
    CodecConfig  cfg;
    CodecOptions opts;
    opts.reject_unknown_flags    = true;
    opts.strict_effects          = true;
    opts.gradient_param_rounding = GradientParamRounding::Truncate;
    cfg.set_options(opts);
    cfg.set_log_level(LogLevel::Warning);
    cfg.set_log_file("/var/log/hue \"lights\"\\codec.log");

    CodecConfig loaded;
    ASSERT_TRUE(loaded.deserialize(cfg.serialize()));
    EXPECT_EQ(loaded.options(), opts);
    EXPECT_EQ(loaded.log_level(), LogLevel::Warning);
    EXPECT_EQ(loaded.log_file(), cfg.log_file());
}

TEST_F(CodecConfigTest, MissingSectionsKeepDefaults)
{
    CodecConfig cfg;
    ASSERT_TRUE(cfg.deserialize(R"({"version": 1})"));
    EXPECT_EQ(cfg.options(), CodecOptions{});
    EXPECT_EQ(cfg.log_level(), LogLevel::Info);
}

TEST_F(CodecConfigTest, UnknownKeysIgnored)
{
    CodecConfig cfg;
    ASSERT_TRUE(cfg.deserialize(R"({
        "version": 1,
        "colour": "blue",
        "codec": { "strict_effects": true, "future_knob": 7 },
        "logging": { "level": "DEBUG" }
    })"));
    EXPECT_TRUE(cfg.options().strict_effects);
    EXPECT_FALSE(cfg.options().reject_unknown_flags);
    EXPECT_EQ(cfg.log_level(), LogLevel::Debug);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rejection leaves the object unchanged
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CodecConfigTest, RejectsEmptyInput)
{
    CodecConfig cfg;
    EXPECT_FALSE(cfg.deserialize(""));
}

TEST_F(CodecConfigTest, RejectsGarbageAndKeepsSettings)
{
    CodecConfig  cfg;
    CodecOptions opts;
    opts.strict_effects = true;
    cfg.set_options(opts);
    cfg.set_log_level(LogLevel::Error);

    for (const char* text : {"this is not json at all",
                             "   \n",
                             "{}",
                             R"({"codec": {"strict_effects": false}})",
                             R"({"version": "one"})",
                             R"({"version": 0})",
                             R"({"version": 1)",
                             R"(["version", 1])"})
    {
        EXPECT_FALSE(cfg.deserialize(text)) << text;
        EXPECT_EQ(cfg.options(), opts) << text;
        EXPECT_EQ(cfg.log_level(), LogLevel::Error) << text;
    }
}

TEST_F(CodecConfigTest, RejectsNewerVersion)
{
    CodecConfig cfg;
    cfg.set_log_level(LogLevel::Error);
    EXPECT_FALSE(cfg.deserialize(R"({"version": 2, "logging": {"level": "trace"}})"));
    EXPECT_EQ(cfg.log_level(), LogLevel::Error);
}

TEST_F(CodecConfigTest, RejectsUnknownRounding)
{
    CodecConfig  cfg;
    CodecOptions opts;
    opts.strict_effects = true;
    cfg.set_options(opts);

    EXPECT_FALSE(cfg.deserialize(
        R"({"version": 1, "codec": {"strict_effects": false, "gradient_param_rounding": "nearest"}})"));
    EXPECT_EQ(cfg.options(), opts);
}

TEST_F(CodecConfigTest, RejectsUnknownLevel)
{
    CodecConfig cfg;
    cfg.set_log_file("keep.log");
    EXPECT_FALSE(cfg.deserialize(R"({"version": 1, "logging": {"level": "loud", "file": "x"}})"));
    EXPECT_EQ(cfg.log_level(), LogLevel::Info);
    EXPECT_EQ(cfg.log_file(), "keep.log");
}

// ═══════════════════════════════════════════════════════════════════════════════
// File I/O
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CodecConfigTest, SaveCreatesDirectoriesAndLoads)
{
    auto path = (dir_ / "nested" / "codec.json").string();

    CodecConfig cfg;
    CodecOptions opts;
    opts.reject_unknown_flags = true;
    cfg.set_options(opts);
    cfg.set_log_level(LogLevel::Trace);
    ASSERT_TRUE(cfg.save(path));
    EXPECT_TRUE(fs::exists(path));

    CodecConfig loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.options(), opts);
    EXPECT_EQ(loaded.log_level(), LogLevel::Trace);
}

TEST_F(CodecConfigTest, LoadMissingFileFails)
{
    CodecConfig cfg;
    EXPECT_FALSE(cfg.load((dir_ / "does_not_exist.json").string()));
    EXPECT_EQ(cfg.options(), CodecOptions{});
}

TEST_F(CodecConfigTest, LoadMalformedFileFails)
{
    fs::create_directories(dir_);
    auto path = (dir_ / "bad.json").string();
    {
        std::ofstream f(path);
        f << R"({"version": 99})";
    }
    CodecConfig cfg;
    EXPECT_FALSE(cfg.load(path));

    {
        std::ofstream f(path, std::ios::trunc);
        f << "strict_effects = true\n";
    }
    EXPECT_FALSE(cfg.load(path));
    EXPECT_EQ(cfg.options(), CodecOptions{});
}

TEST_F(CodecConfigTest, DefaultPathHonorsXdgConfigHome)
{
    const char* old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg_test", 1);
    EXPECT_EQ(CodecConfig::default_path(), "/tmp/xdg_test/huewire/codec.json");

    if (old)
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else
        unsetenv("XDG_CONFIG_HOME");
}

TEST_F(CodecConfigTest, DefaultPathEndsWithFileName)
{
    EXPECT_EQ(fs::path(CodecConfig::default_path()).filename(), "codec.json");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Logging setup
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CodecConfigTest, ApplyLoggingConsoleOnly)
{
    CodecConfig cfg;
    cfg.set_log_level(LogLevel::Error);
    cfg.apply_logging();
    EXPECT_EQ(Logger::instance().sink_count(), 1u);
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);
}

TEST_F(CodecConfigTest, ApplyLoggingWithFileWritesEntries)
{
    fs::create_directories(dir_);
    auto log_path = (dir_ / "codec.log").string();

    CodecConfig cfg;
    cfg.set_log_level(LogLevel::Warning);
    cfg.set_log_file(log_path);
    cfg.apply_logging();
    EXPECT_EQ(Logger::instance().sink_count(), 2u);

    HUEWIRE_LOG_WARN("test", "frame {} rejected", 7);
    Logger::instance().clear_sinks();

    std::ifstream f(log_path);
    std::string   contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("frame 7 rejected"), std::string::npos) << contents;
    EXPECT_NE(contents.find("WARN"), std::string::npos) << contents;
}
