/**
 * @file app_config.hpp
 * @brief Optional JSON configuration file and environment overrides.
 */

#ifndef VIDTOOL_APP_CONFIG_HPP
#define VIDTOOL_APP_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace vidtool {

/**
 * @brief Settings that are not tied to one invocation.
 *
 * Precedence: command line > environment > config file > defaults.
 * This struct holds the merge of the last three; the CLI applies its own
 * options on top.
 */
struct AppConfig {
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    std::optional<std::filesystem::path> preset_file;  ///< Default: PresetStore::default_location()
    unsigned workers = 1;
    std::chrono::seconds probe_timeout{30};
    std::string log_level = "ERROR";
    std::optional<std::filesystem::path> log_file;

    /**
     * @brief Default location of the config file.
     *
     * $VIDTOOL_CONFIG, else $XDG_CONFIG_HOME/vidtool/config.json, else
     * ~/.config/vidtool/config.json.
     */
    static std::filesystem::path default_location();

    /**
     * @brief Load configuration.
     *
     * @param explicit_path From --config; must exist when given.
     * @throws ConfigError on a missing explicit file, malformed JSON or invalid values.
     */
    static AppConfig load(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

    /**
     * @brief Parse one config file over the defaults, without environment overrides.
     * @throws ConfigError
     */
    static AppConfig from_file(const std::filesystem::path& path);

    /// Apply VIDTOOL_FFMPEG and VIDTOOL_FFPROBE.
    void apply_environment();
};

} // namespace vidtool

#endif // VIDTOOL_APP_CONFIG_HPP
