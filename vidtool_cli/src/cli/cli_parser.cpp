#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

namespace {
// options that shape the transcode command, shared by `reencode` and `preset save`
void add_transcode_options(CLI::App* sub, TranscodeFlags& t) {
    sub->add_option("--vcodec", t.vcodec,
                    "Video codec (or 'copy' to copy rather than re-encode video).");

    sub->add_option("--acodec", t.acodec,
                    "Audio codec (or 'copy' to copy rather than re-encode audio).");

    sub->add_flag("--strip-video", t.strip_video, "Strip video streams.");
    sub->add_flag("--strip-audio", t.strip_audio, "Strip audio streams.");
    sub->add_flag("--strip-subs", t.strip_subs, "Strip subtitle streams.");
    sub->add_flag("--strip-data", t.strip_data, "Strip data streams.");

    sub->add_flag("--av-copy-only", t.av_copy_only,
                  "Copy audio and video streams only, strip everything else.");

    sub->add_flag("--x265", t.x265,
                  "Encode video with libx265 (CRF 28 unless --crf is given).");

    sub->add_option("--crf", t.crf, "Constant rate factor for the video encoder (0-63).")
        ->check(CLI::Range(0, 63));

    sub->add_flag("--fix-resolution", t.fix_resolution,
                  "Scale odd dimensions down to the nearest even resolution.");

    sub->add_flag("--fix-errors", t.fix_errors,
                  "Ignore decoding errors (-err_detect ignore_err).");

    sub->add_option("--custom-flags", t.custom_flags,
                    "Extra flags passed verbatim to ffmpeg, e.g. --custom-flags=\"-preset slow\". "
                    "(Can be used multiple times).")
        ->allow_extra_args(false);
}

template <typename T>
void check_range(const T min, const T max, const char* what) {
    if (min > 0 && max > 0 && min > max) {
        throw CLI::ValidationError(std::string("--min-") + what + " is greater than --max-" + what + ".");
    }
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- Global options ---
    auto* log_level = app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a file (rotated at 10 MB, 3 backups).");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--config", settings.config_path,
                   "Configuration file (default: $VIDTOOL_CONFIG or ~/.config/vidtool/config.json).")
                   ->check(CLI::ExistingFile);

    app.add_option("--ffmpeg", settings.ffmpeg, "Path or name of the ffmpeg binary.");
    app.add_option("--ffprobe", settings.ffprobe, "Path or name of the ffprobe binary.");

    app.add_option("--workers", settings.workers,
                   "Number of files transcoded simultaneously (default: 1).")
                   ->check(CLI::PositiveNumber);

    app.add_option("--preset-file", settings.preset_file,
                   "Preset store (default: ~/.config/vidtool/presets.json).");

    // --- reencode ---
    auto* reencode = app.add_subcommand("reencode",
        "Re-encode a file (or, with --batch, every matching file) to EXT, appending SUFFIX to the name.");

    reencode->add_option("pattern", settings.pattern,
                         "Input file, or with --batch a pattern such as \"*.avi\".")
        ->required();
    reencode->add_option("ext", settings.ext,
                         "Extension of the output files; it determines the container.");
    reencode->add_option("suffix", settings.suffix,
                         "Suffix added after the file name and before the extension.");

    reencode->add_flag("--batch", settings.batch,
                       "Re-encode every file matching PATTERN under the roots (default: current directory).");
    reencode->add_flag("--regex", settings.regex,
                       "Treat PATTERN and --exclude values as regular expressions instead of globs.");
    reencode->add_option("--root", settings.roots,
                         "Directory or file to select from (with --batch). (Can be used multiple times).")
        ->allow_extra_args(false)
        ->check(CLI::ExistingPath);
    auto* recursive = reencode->add_flag("-r,--recursive", settings.recursive,
                                         "Descend into subdirectories (with --batch).");
    reencode->add_option("--depth", settings.depth,
                         "Maximum recursion depth with --recursive (default: unlimited).")
        ->check(CLI::NonNegativeNumber)
        ->needs(recursive);

    reencode->add_option("--exclude", settings.exclude_patterns,
                         "Skip files whose name matches PATTERN. (Can be used multiple times).")
        ->allow_extra_args(false);
    reencode->add_option("--only-ext", settings.only_ext,
                         "Only files with these extensions (comma separated).")
        ->delimiter(',');
    reencode->add_option("--only-vcodec", settings.only_vcodec,
                         "Only files with a video stream in one of these codecs (comma separated).")
        ->delimiter(',');
    reencode->add_option("--only-acodec", settings.only_acodec,
                         "Only files with an audio stream in one of these codecs (comma separated).")
        ->delimiter(',');
    reencode->add_option("--mime", settings.mime_prefixes,
                         "Only files whose detected MIME type starts with PREFIX, e.g. video/.")
        ->delimiter(',');
    reencode->add_option("--min-width", settings.min_width, "Minimum video width.")->check(CLI::PositiveNumber);
    reencode->add_option("--max-width", settings.max_width, "Maximum video width.")->check(CLI::PositiveNumber);
    reencode->add_option("--min-height", settings.min_height, "Minimum video height.")->check(CLI::PositiveNumber);
    reencode->add_option("--max-height", settings.max_height, "Maximum video height.")->check(CLI::PositiveNumber);
    reencode->add_option("--min-size", settings.min_size, "Minimum file size in bytes.")->check(CLI::PositiveNumber);
    reencode->add_option("--max-size", settings.max_size, "Maximum file size in bytes.")->check(CLI::PositiveNumber);
    reencode->add_option("--min-duration", settings.min_duration, "Minimum duration in seconds.")->check(CLI::PositiveNumber);
    reencode->add_option("--max-duration", settings.max_duration, "Maximum duration in seconds.")->check(CLI::PositiveNumber);

    add_transcode_options(reencode, settings.transcode);

    auto* force = reencode->add_flag("--force", settings.force, "Overwrite existing files.");
    auto* no_clobber = reencode->add_flag("--no-clobber", settings.no_clobber, "Never overwrite existing files.");
    auto* increment = reencode->add_flag("--increment", settings.increment,
                                         "Pick a free name (name_001, name_002, ...) when the output exists.");
    force->excludes(no_clobber)->excludes(increment);
    no_clobber->excludes(increment);

    reencode->add_option("--name-pattern", settings.name_pattern,
                         "Output name pattern without extension (default: {stem}{suffix}). Placeholders: "
                         "{stem} {parent} {ext} {suffix} {resolution} {width} {height} {vcodec} {acodec} {duration}.");
    reencode->add_option("-o,--output-dir", settings.output_dir,
                         "Write outputs to this directory instead of next to each source.");
    reencode->add_flag("--dry-run", settings.dry_run,
                       "Print the commands without running them.");
    reencode->add_option("--report", settings.report_path,
                         "CSV report export filename.")
        ->take_last(); // if used multiple times, take the last one
    reencode->add_option("--preset", settings.preset,
                         "Start from a saved preset; flags given here override it.");
    reencode->add_option("--save-preset", settings.save_preset,
                         "Save the effective options as a preset before running.");

    reencode->callback([&settings]() {
        settings.command = Command::Reencode;

        if (!settings.batch && (settings.regex || settings.recursive || !settings.roots.empty())) {
            throw CLI::ValidationError("--regex, --recursive and --root require --batch.");
        }
        if (settings.ext.empty() && settings.preset.empty()) {
            throw CLI::ValidationError("EXT and SUFFIX are required unless --preset is given.");
        }
        check_range(settings.min_width, settings.max_width, "width");
        check_range(settings.min_height, settings.max_height, "height");
        check_range(settings.min_size, settings.max_size, "size");
        check_range(settings.min_duration, settings.max_duration, "duration");
    });

    // --- info ---
    auto* info = app.add_subcommand("info", "Show information about a video file.");
    info->add_option("file", settings.info_file, "Video file to describe.")
        ->required()
        ->check(CLI::ExistingFile);
    info->add_flag("--json", settings.json, "Output information in JSON format.");
    info->callback([&settings]() { settings.command = Command::Info; });

    // --- rename ---
    auto* rename = app.add_subcommand("rename",
        "Rename a file (or, with --batch, every video under a directory) to include its resolution.");
    rename->add_option("file", settings.rename_target,
                       "File to rename, or directory with --batch (default: current directory).")
        ->check(CLI::ExistingPath);
    rename->add_flag("--batch", settings.rename_batch, "Rename every video file under the directory, recursively.");
    rename->callback([&settings]() {
        settings.command = Command::Rename;
        if (!settings.rename_batch && settings.rename_target.empty()) {
            throw CLI::ValidationError("FILE is required if not using --batch.");
        }
        if (settings.rename_batch && settings.rename_target.empty()) {
            settings.rename_target = ".";
        }
    });

    // --- preset ---
    auto* preset = app.add_subcommand("preset", "Manage saved transcode presets.");
    preset->require_subcommand(1);
    preset->callback([&settings]() { settings.command = Command::Preset; });

    preset->add_subcommand("list", "List preset names.")
        ->callback([&settings]() { settings.preset_action = PresetAction::List; });

    auto* show = preset->add_subcommand("show", "Print a preset.");
    show->add_option("name", settings.preset_name, "Preset name.")->required();
    show->callback([&settings]() { settings.preset_action = PresetAction::Show; });

    auto* save = preset->add_subcommand("save", "Create or overwrite a preset from transcode flags.");
    save->add_option("name", settings.preset_name, "Preset name.")->required();
    save->add_option("--description", settings.preset_description, "Free-form description.");
    save->add_option("--ext", settings.preset_ext, "Default output extension.");
    save->add_option("--suffix", settings.preset_suffix, "Default output suffix.");
    add_transcode_options(save, settings.transcode);
    save->callback([&settings]() { settings.preset_action = PresetAction::Save; });

    auto* remove = preset->add_subcommand("delete", "Delete a preset (no error if absent).");
    remove->add_option("name", settings.preset_name, "Preset name.")->required();
    remove->callback([&settings]() { settings.preset_action = PresetAction::Delete; });

    auto* rename_preset = preset->add_subcommand("rename", "Rename a preset.");
    rename_preset->add_option("name", settings.preset_name, "Current name.")->required();
    rename_preset->add_option("new_name", settings.preset_new_name, "New name.")->required();
    rename_preset->callback([&settings]() { settings.preset_action = PresetAction::Rename; });

    auto* import_cmd = preset->add_subcommand("import", "Merge presets from an exported file.");
    import_cmd->add_option("file", settings.preset_path, "File written by 'preset export'.")
        ->required()
        ->check(CLI::ExistingFile);
    import_cmd->callback([&settings]() { settings.preset_action = PresetAction::Import; });

    auto* export_cmd = preset->add_subcommand("export", "Write presets to a standalone file.");
    export_cmd->add_option("file", settings.preset_path, "Destination file.")->required();
    export_cmd->add_option("names", settings.preset_names, "Presets to export (default: all).");
    export_cmd->callback([&settings]() { settings.preset_action = PresetAction::Export; });

    // --- Cross-validation logic ---
    app.callback([&settings, log_level]() {
        settings.log_level_given = log_level->count() > 0;
    });
}
