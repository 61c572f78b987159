#pragma once

#include <huewire/codec.hpp>
#include <huewire/logger.hpp>
#include <string>

namespace huewire
{

// Persistent codec configuration: codec policies plus logging setup, stored
// as a small JSON document (see default_path()).
class CodecConfig
{
   public:
    CodecConfig() = default;

    const CodecOptions& options() const { return options_; }
    void                set_options(const CodecOptions& options) { options_ = options; }

    LogLevel log_level() const { return log_level_; }
    void     set_log_level(LogLevel level) { log_level_ = level; }

    // Empty means "no file sink".
    const std::string& log_file() const { return log_file_; }
    void               set_log_file(std::string path) { log_file_ = std::move(path); }

    // Reset the global logger to this configuration: console sink, optional
    // file sink, minimum level.
    void apply_logging() const;

    std::string serialize() const;

    // Returns false (and leaves this object untouched) unless the text is a
    // JSON object with a supported numeric "version" and known enum values.
    // Unknown keys are ignored.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;

    // Returns false if the file cannot be read or does not parse.
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/huewire/codec.json, else ~/.config/huewire/codec.json.
    static std::string default_path();

    static constexpr int VERSION = 1;

   private:
    CodecOptions options_;
    LogLevel     log_level_ = LogLevel::Info;
    std::string  log_file_;
};

}  // namespace huewire
