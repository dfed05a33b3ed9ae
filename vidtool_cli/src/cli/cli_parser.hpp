#ifndef VIDTOOL_CLI_PARSER_HPP
#define VIDTOOL_CLI_PARSER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Reencode,
    Info,
    Rename,
    Preset
};

enum class PresetAction {
    List,
    Show,
    Save,
    Delete,
    Rename,
    Import,
    Export
};

/**
 * @brief Transcode flags shared by `reencode` and `preset save`.
 *
 * Empty strings and negative numbers mean "not given", so that flags can
 * be layered over a preset.
 */
struct TranscodeFlags {
    std::string vcodec;
    std::string acodec;
    bool strip_video = false;
    bool strip_audio = false;
    bool strip_subs = false;
    bool strip_data = false;
    bool av_copy_only = false;
    bool x265 = false;
    int crf = -1;
    bool fix_resolution = false;
    bool fix_errors = false;
    std::vector<std::string> custom_flags;
};

struct Settings {
    // --- global ---
    std::string log_level = "ERROR";
    bool log_level_given = false;
    std::filesystem::path log_file;
    bool quiet = false;
    std::filesystem::path config_path;
    std::string ffmpeg;
    std::string ffprobe;
    unsigned workers = 0;                 ///< 0: from config
    std::filesystem::path preset_file;    ///< Empty: from config
    Command command = Command::None;

    // --- reencode ---
    std::string pattern;
    std::string ext;
    std::string suffix;
    bool batch = false;
    bool regex = false;
    bool recursive = false;
    int depth = -1;                       ///< With --recursive; negative: unlimited
    std::vector<std::filesystem::path> roots;
    std::vector<std::string> exclude_patterns;
    std::vector<std::string> only_ext;
    std::vector<std::string> only_vcodec;
    std::vector<std::string> only_acodec;
    std::vector<std::string> mime_prefixes;
    int min_width = 0;
    int max_width = 0;
    int min_height = 0;
    int max_height = 0;
    std::uintmax_t min_size = 0;
    std::uintmax_t max_size = 0;
    double min_duration = 0.0;
    double max_duration = 0.0;
    TranscodeFlags transcode;
    bool force = false;
    bool no_clobber = false;
    bool increment = false;
    std::string name_pattern;
    std::filesystem::path output_dir;
    bool dry_run = false;
    std::filesystem::path report_path;
    std::string preset;
    std::string save_preset;

    // --- info ---
    std::filesystem::path info_file;
    bool json = false;

    // --- rename ---
    std::filesystem::path rename_target;
    bool rename_batch = false;

    // --- preset ---
    PresetAction preset_action = PresetAction::List;
    std::string preset_name;
    std::string preset_new_name;
    std::string preset_description;
    std::string preset_ext;
    std::string preset_suffix;
    std::filesystem::path preset_path;
    std::vector<std::string> preset_names;
};

/**
 * @brief Configures the CLI11 parser with all subcommands, options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // VIDTOOL_CLI_PARSER_HPP
