#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <huewire/config.hpp>
#include <huewire/logger.hpp>
#include <iterator>
#include <optional>
#include <sstream>
#include <system_error>

namespace huewire
{

void CodecConfig::apply_logging() const
{
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.add_sink(sinks::console_sink());
    if (!log_file_.empty())
        logger.add_sink(sinks::file_sink(log_file_));
    logger.set_level(log_level_);

    HUEWIRE_LOG_DEBUG("config",
                      "logging configured: level={} file={}",
                      Logger::level_to_string(log_level_),
                      log_file_.empty() ? std::string("<none>") : log_file_);
}

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 == s.size())
        {
            out += s[i];
            continue;
        }
        char next = s[++i];
        switch (next)
        {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += next;
                break;
        }
    }
    return out;
}

static const char* rounding_to_string(GradientParamRounding rounding)
{
    return rounding == GradientParamRounding::Truncate ? "truncate" : "reject";
}

static std::optional<GradientParamRounding> rounding_from_string(const std::string& name)
{
    if (name == "reject")
        return GradientParamRounding::Reject;
    if (name == "truncate")
        return GradientParamRounding::Truncate;
    return std::nullopt;
}

std::string CodecConfig::serialize() const
{
    std::string level = Logger::level_to_string(log_level_);
    for (auto& c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << VERSION << ",\n";
    os << "  \"codec\": {\n";
    os << "    \"reject_unknown_flags\": " << (options_.reject_unknown_flags ? "true" : "false")
       << ",\n";
    os << "    \"strict_effects\": " << (options_.strict_effects ? "true" : "false") << ",\n";
    os << "    \"gradient_param_rounding\": \""
       << rounding_to_string(options_.gradient_param_rounding) << "\"\n";
    os << "  },\n";
    os << "  \"logging\": {\n";
    os << "    \"level\": \"" << level << "\",\n";
    os << "    \"file\": \"" << escape_json(log_file_) << "\"\n";
    os << "  }\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for our specific format

static std::optional<size_t> find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos)
        return std::nullopt;
    return pos;
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (!pos || json[*pos] != '"')
        return std::nullopt;
    size_t end = *pos + 1;
    while (end < json.size())
    {
        if (json[end] == '"' && json[end - 1] != '\\')
            break;
        ++end;
    }
    if (end >= json.size())
        return std::nullopt;
    return unescape_json(json.substr(*pos + 1, end - *pos - 1));
}

static bool read_json_bool(const std::string& json, const std::string& key, bool def)
{
    auto pos = find_value(json, key);
    if (!pos)
        return def;
    if (json.compare(*pos, 4, "true") == 0)
        return true;
    if (json.compare(*pos, 5, "false") == 0)
        return false;
    return def;
}

// Text of the object value for `key`, braces included, or "" if absent.
static std::string read_json_object(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (!pos || json[*pos] != '{')
        return "";

    int depth = 0;
    for (size_t i = *pos; i < json.size(); ++i)
    {
        if (json[i] == '{')
            ++depth;
        else if (json[i] == '}')
        {
            --depth;
            if (depth == 0)
                return json.substr(*pos, i - *pos + 1);
        }
    }
    return "";
}

bool CodecConfig::deserialize(const std::string& json)
{
    const auto first = json.find_first_not_of(" \t\n\r");
    const auto last  = json.find_last_not_of(" \t\n\r");
    if (first == std::string::npos || json[first] != '{' || json[last] != '}')
    {
        HUEWIRE_LOG_WARN("config", "config is not a JSON object");
        return false;
    }

    auto vpos = find_value(json, "version");
    if (!vpos || !std::isdigit(static_cast<unsigned char>(json[*vpos])))
    {
        HUEWIRE_LOG_WARN("config", "config has no numeric version");
        return false;
    }
    int ver = std::atoi(json.c_str() + *vpos);
    if (ver < 1 || ver > VERSION)
    {
        HUEWIRE_LOG_WARN("config", "unsupported config version {}", ver);
        return false;
    }

    CodecConfig parsed;

    std::string codec = read_json_object(json, "codec");
    if (!codec.empty())
    {
        parsed.options_.reject_unknown_flags = read_json_bool(codec, "reject_unknown_flags", false);
        parsed.options_.strict_effects       = read_json_bool(codec, "strict_effects", false);
        if (auto name = read_json_string(codec, "gradient_param_rounding"))
        {
            auto rounding = rounding_from_string(*name);
            if (!rounding)
            {
                HUEWIRE_LOG_WARN("config", "unknown gradient_param_rounding '{}'", *name);
                return false;
            }
            parsed.options_.gradient_param_rounding = *rounding;
        }
    }

    std::string logging = read_json_object(json, "logging");
    if (!logging.empty())
    {
        if (auto name = read_json_string(logging, "level"))
        {
            auto level = parse_log_level(*name);
            if (!level)
            {
                HUEWIRE_LOG_WARN("config", "unknown log level '{}'", *name);
                return false;
            }
            parsed.log_level_ = *level;
        }
        if (auto file = read_json_string(logging, "file"))
            parsed.log_file_ = *file;
    }

    *this = std::move(parsed);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool CodecConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            HUEWIRE_LOG_ERROR("config", "cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        HUEWIRE_LOG_ERROR("config", "cannot open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool CodecConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        HUEWIRE_LOG_DEBUG("config", "no config at {}, keeping defaults", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string CodecConfig::default_path()
{
    namespace fs = std::filesystem;

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return (fs::path(xdg) / "huewire" / "codec.json").string();

    const char* home = std::getenv("HOME");
    if (!home)
        return "codec.json";
    return (fs::path(home) / ".config" / "huewire" / "codec.json").string();
}

}  // namespace huewire
