#include "../../include/app_config.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstdlib>
#include <system_error>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

namespace vidtool {

fs::path AppConfig::default_location() {
    if (const char* env = std::getenv("VIDTOOL_CONFIG"); env && *env) return env;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "vidtool" / "config.json";
    }
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / ".config" / "vidtool" / "config.json";
}

AppConfig AppConfig::from_file(const fs::path& path) {
    pt::ptree root;
    try {
        pt::read_json(path.string(), root);
    } catch (const pt::ptree_error& e) {
        throw ConfigError("Cannot read config " + path.string() + ": " + e.what());
    }

    AppConfig config;
    try {
        config.ffmpeg = root.get<std::string>("ffmpeg", config.ffmpeg);
        config.ffprobe = root.get<std::string>("ffprobe", config.ffprobe);
        if (auto v = root.get_optional<std::string>("preset_file")) config.preset_file = fs::path(*v);
        if (auto v = root.get_optional<std::string>("log_file")) config.log_file = fs::path(*v);
        config.log_level = root.get<std::string>("log_level", config.log_level);

        // no fallback here: a malformed number must raise
        if (root.get_child_optional("workers")) {
            const int workers = root.get<int>("workers");
            if (workers < 1) throw ConfigError("workers must be at least 1 in " + path.string());
            config.workers = static_cast<unsigned>(workers);
        }
        if (root.get_child_optional("probe_timeout_seconds")) {
            const int timeout = root.get<int>("probe_timeout_seconds");
            if (timeout < 1) throw ConfigError("probe_timeout_seconds must be at least 1 in " + path.string());
            config.probe_timeout = std::chrono::seconds(timeout);
        }
    } catch (const pt::ptree_error& e) {
        throw ConfigError("Invalid value in config " + path.string() + ": " + e.what());
    }

    if (to_lower(config.log_level) != "none" && !Logger::string_to_level(config.log_level)) {
        throw ConfigError("Unknown log_level '" + config.log_level + "' in " + path.string());
    }
    return config;
}

void AppConfig::apply_environment() {
    if (const char* v = std::getenv("VIDTOOL_FFMPEG"); v && *v) ffmpeg = v;
    if (const char* v = std::getenv("VIDTOOL_FFPROBE"); v && *v) ffprobe = v;
}

AppConfig AppConfig::load(const std::optional<fs::path>& explicit_path) {
    AppConfig config;
    std::error_code ec;
    if (explicit_path) {
        if (!fs::exists(*explicit_path, ec)) {
            throw ConfigError("Config file not found: " + explicit_path->string());
        }
        config = from_file(*explicit_path);
    } else if (const auto location = default_location(); fs::exists(location, ec)) {
        config = from_file(location);
    }
    config.apply_environment();
    return config;
}

} // namespace vidtool
