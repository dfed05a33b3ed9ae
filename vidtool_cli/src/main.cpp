#include <iostream>
#include <filesystem>
#include <csignal>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <clocale>
#include <iomanip>
#include <optional>
#include <string>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "../utils/color.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libvidtool/include/app_config.hpp"
#include "../../libvidtool/include/errors.hpp"
#include "../../libvidtool/include/event_bus.hpp"
#include "../../libvidtool/include/events.hpp"
#include "../../libvidtool/include/job_orchestrator.hpp"
#include "../../libvidtool/include/logger.hpp"
#include "../../libvidtool/include/media_prober.hpp"
#include "../../libvidtool/include/preset_store.hpp"
#include "../../libvidtool/include/renamer.hpp"
#include "../../libvidtool/include/selector.hpp"
#include "../../libvidtool/include/tool_locator.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace vidtool;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<JobOrchestrator*> g_orchestrator{nullptr};

// handle ctrl+c or termination signals
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        constexpr char msg[] = "\n[INTERRUPT] Stop detected. Terminating running jobs...\n";
        [[maybe_unused]] const auto n = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        if (auto* orchestrator = g_orchestrator.load()) {
            orchestrator->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void setup_logging(const Settings& settings, const AppConfig& config) {
    Logger::clear_sinks();

    const fs::path log_file = !settings.log_file.empty() ? settings.log_file : config.log_file.value_or(fs::path{});
    if (!log_file.empty()) {
        Logger::add_sink(std::make_unique<FileLogSink>(log_file));
    }

    if (!settings.quiet) {
        const std::string level = settings.log_level_given ? settings.log_level : config.log_level;
        if (const auto parsed = Logger::string_to_level(level)) {
            auto consoleSink = std::make_unique<ConsoleLogSink>();
            consoleSink->log_level = *parsed;
            Logger::add_sink(std::move(consoleSink));
        }
    }
}

static fs::path preset_file_of(const Settings& settings, const AppConfig& config) {
    if (!settings.preset_file.empty()) return settings.preset_file;
    return config.preset_file.value_or(PresetStore::default_location());
}

// command line flags override the corresponding preset fields
static TranscodeOptions layer_flags(TranscodeOptions base, const TranscodeFlags& f) {
    if (!f.vcodec.empty()) {
        base.video_codec = f.vcodec;
        base.x265 = false;
    }
    if (!f.acodec.empty()) base.audio_codec = f.acodec;
    if (f.x265) {
        base.x265 = true;
        base.video_codec.reset();
    }
    if (f.strip_video) {
        base.strip_video = true;
        base.video_codec.reset();
        base.x265 = false;
        base.crf.reset();
        base.fix_resolution = false;
    }
    if (f.strip_audio) {
        base.strip_audio = true;
        base.audio_codec.reset();
    }
    if (f.av_copy_only) {
        base = TranscodeOptions{.av_copy_only = true, .fix_errors = base.fix_errors, .custom_flags = base.custom_flags};
    }
    base.strip_subtitles = base.strip_subtitles || f.strip_subs;
    base.strip_data = base.strip_data || f.strip_data;
    if (f.crf >= 0) base.crf = f.crf;
    base.fix_resolution = base.fix_resolution || f.fix_resolution;
    base.fix_errors = base.fix_errors || f.fix_errors;
    for (const auto& text : f.custom_flags) {
        for (auto& flag : split_custom_flags(text)) base.custom_flags.push_back(std::move(flag));
    }
    return base;
}

static bool ask_overwrite(const fs::path& source, const fs::path& output) {
    std::cerr << YELLOW << "\nOutput " << output.string() << " (from " << source.filename().string()
              << ") exists. Overwrite? [y/N] " << RESET << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

static SelectionCriteria build_criteria(const Settings& settings) {
    SelectionCriteria criteria;
    const auto kind = settings.regex ? NamePattern::Kind::Regex : NamePattern::Kind::Glob;
    if (settings.batch) criteria.pattern = NamePattern{kind, settings.pattern};
    for (const auto& ex : settings.exclude_patterns) criteria.exclude.push_back(NamePattern{kind, ex});
    criteria.extensions.insert(settings.only_ext.begin(), settings.only_ext.end());
    criteria.video_codecs.insert(settings.only_vcodec.begin(), settings.only_vcodec.end());
    criteria.audio_codecs.insert(settings.only_acodec.begin(), settings.only_acodec.end());
    criteria.mime_prefixes = settings.mime_prefixes;
    if (settings.min_width > 0) criteria.width.min = settings.min_width;
    if (settings.max_width > 0) criteria.width.max = settings.max_width;
    if (settings.min_height > 0) criteria.height.min = settings.min_height;
    if (settings.max_height > 0) criteria.height.max = settings.max_height;
    if (settings.min_size > 0) criteria.size_bytes.min = settings.min_size;
    if (settings.max_size > 0) criteria.size_bytes.max = settings.max_size;
    if (settings.min_duration > 0) criteria.duration_seconds.min = settings.min_duration;
    if (settings.max_duration > 0) criteria.duration_seconds.max = settings.max_duration;
    return criteria;
}

static int run_reencode(const Settings& settings, const AppConfig& config) {
    const ToolPaths tools = resolve_tool_paths(settings.ffprobe.empty() ? config.ffprobe : settings.ffprobe,
                                               settings.ffmpeg.empty() ? config.ffmpeg : settings.ffmpeg);
    const unsigned workers = settings.workers > 0 ? settings.workers : config.workers;

    // transcode and naming options, preset first
    TranscodeOptions base;
    std::string ext = settings.ext;
    std::string suffix = settings.suffix;
    std::optional<PresetStore> store;
    if (!settings.preset.empty() || !settings.save_preset.empty()) {
        store.emplace(preset_file_of(settings, config), true);
    }
    if (!settings.preset.empty()) {
        const Preset preset = store->get(settings.preset);
        base = preset.options;
        if (ext.empty()) ext = preset.output_extension;
        if (suffix.empty()) suffix = preset.output_suffix;
    }
    const TranscodeOptions options = layer_flags(base, settings.transcode);
    options.validate();

    if (!settings.save_preset.empty()) {
        Preset saved{settings.save_preset, "", options, ext, suffix};
        store->save(saved);
        Logger::log(LogLevel::Info, "Saved preset '" + settings.save_preset + "'", "main");
    }

    OutputOptions output;
    if (!settings.name_pattern.empty()) output.pattern = settings.name_pattern;
    output.extension = ext;
    output.suffix = suffix;
    if (!settings.output_dir.empty()) output.output_directory = settings.output_dir;
    output.collision = settings.force ? CollisionPolicy::Force
                     : settings.no_clobber ? CollisionPolicy::NoClobber
                     : settings.increment ? CollisionPolicy::Increment
                     : CollisionPolicy::Prompt;

    ChildProcessRunner runner;
    MediaProber prober(runner, tools.ffprobe, config.probe_timeout);
    EventBus bus;

    // selection
    std::vector<fs::path> roots;
    int depth = 0;
    if (settings.batch) {
        roots = settings.roots.empty() ? std::vector<fs::path>{fs::current_path()} : settings.roots;
        depth = settings.recursive ? settings.depth : 0;
    } else {
        roots.emplace_back(settings.pattern);
    }

    Selector selector(prober, &bus);
    const SelectionResult selection = selector.select(roots, build_criteria(settings), depth);
    for (const auto& w : selection.warnings) {
        std::cerr << YELLOW << "[WARN] " << w.path.string() << ": " << w.message << RESET << std::endl;
    }
    if (selection.files.empty()) {
        Logger::log(LogLevel::Error, "No matching input files.", "main");
        std::cerr << "No matching input files." << std::endl;
        return 1;
    }

    JobOrchestrator orchestrator(prober, runner, tools.ffmpeg, bus, workers);
    orchestrator.set_dry_run(settings.dry_run);

    // registered before planning so a signal also interrupts the probes
    g_orchestrator.store(&orchestrator);
    struct Unregister {
        ~Unregister() { g_orchestrator.store(nullptr); }
    } unregister;
    if (interrupted.load()) orchestrator.request_stop();
    if (output.collision == CollisionPolicy::Prompt && isatty(STDIN_FILENO)) {
        orchestrator.set_collision_handler(ask_overwrite);
    }

    // progress tracking
    const auto start_total = std::chrono::steady_clock::now();
    if (!settings.quiet) {
        bus.subscribe<JobStartEvent>([](const JobStartEvent& e) {
            std::cerr << CYAN << "\n[START] " << e.source.filename().string()
                      << " -> " << e.output.filename().string() << RESET << std::endl;
        });
        bus.subscribe<JobCompleteEvent>([&settings](const JobCompleteEvent& e) {
            const char* color = e.status == JobStatus::Succeeded ? GREEN
                              : e.status == JobStatus::Failed ? RED : YELLOW;
            std::string tag = e.status == JobStatus::Skipped && settings.dry_run ? "dry-run" : std::string(to_string(e.status));
            std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char c) { return std::toupper(c); });
            std::cerr << color << "\n[" << tag << "] " << e.source.filename().string();
            if (e.status == JobStatus::Failed || e.status == JobStatus::Skipped) {
                const auto nl = e.detail.find('\n');
                std::cerr << " (" << e.detail.substr(0, nl) << ")";
            }
            std::cerr << RESET << std::endl;
        });
        bus.subscribe<BatchProgressEvent>([start_total](const BatchProgressEvent& e) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(e.counts.settled(), e.total, elapsed);
        });
    }

    if (settings.dry_run) {
        const auto& jobs = orchestrator.plan(selection.files, options, output);
        for (const auto& job : jobs) {
            if (job.command()) {
                std::cout << job.command()->to_display_string(tools.ffmpeg.filename().string()) << std::endl;
            }
        }
    } else {
        orchestrator.plan(selection.files, options, output);
    }

    const BatchResult result = orchestrator.execute();

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(result, workers);
    }

    // export CSV if requested
    if (!settings.report_path.empty() && !export_csv_report(result, settings.report_path)) {
        Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
    }

    if (interrupted.load() || result.cancelled) {
        return 130; // standard exit code for SIGINT
    }
    return result.counts.failed > 0 ? 1 : 0;
}

static int run_info(const Settings& settings, const AppConfig& config) {
    ChildProcessRunner runner;
    MediaProber prober(runner,
                       resolve_probe_tool(settings.ffprobe.empty() ? config.ffprobe : settings.ffprobe),
                       config.probe_timeout);
    const auto descriptor = prober.probe(settings.info_file);
    if (settings.json) {
        std::cout << descriptor_to_json(*descriptor);
    } else {
        std::cout << format_info_block(*descriptor);
    }
    return 0;
}

static int run_rename(const Settings& settings, const AppConfig& config) {
    ChildProcessRunner runner;
    MediaProber prober(runner,
                       resolve_probe_tool(settings.ffprobe.empty() ? config.ffprobe : settings.ffprobe),
                       config.probe_timeout);

    if (!settings.rename_batch) {
        const RenameOutcome outcome = rename_with_resolution(prober, settings.rename_target);
        std::cout << outcome.from.string() << " -> " << outcome.to.string() << std::endl;
        return 0;
    }

    int failures = 0;
    for (const auto& outcome : rename_batch(prober, settings.rename_target)) {
        if (outcome.renamed) {
            std::cout << outcome.from.string() << " -> " << outcome.to.string() << std::endl;
        } else {
            std::cerr << YELLOW << "[SKIP] " << outcome.from.string() << ": " << outcome.detail << RESET << std::endl;
            ++failures;
        }
    }
    return failures > 0 ? 1 : 0;
}

static void print_preset(const Preset& p) {
    const auto& o = p.options;
    std::cout << p.name << "\n";
    if (!p.description.empty()) std::cout << "  description:  " << p.description << "\n";
    if (!p.output_extension.empty()) std::cout << "  extension:    " << p.output_extension << "\n";
    if (!p.output_suffix.empty()) std::cout << "  suffix:       " << p.output_suffix << "\n";
    if (o.video_codec) std::cout << "  video codec:  " << *o.video_codec << "\n";
    if (o.audio_codec) std::cout << "  audio codec:  " << *o.audio_codec << "\n";
    if (o.x265) std::cout << "  x265\n";
    if (o.crf) std::cout << "  crf:          " << *o.crf << "\n";
    if (o.strip_video) std::cout << "  strip video\n";
    if (o.strip_audio) std::cout << "  strip audio\n";
    if (o.strip_subtitles) std::cout << "  strip subtitles\n";
    if (o.strip_data) std::cout << "  strip data\n";
    if (o.av_copy_only) std::cout << "  av copy only\n";
    if (o.fix_resolution) std::cout << "  fix resolution\n";
    if (o.fix_errors) std::cout << "  fix errors\n";
    for (const auto& f : o.custom_flags) std::cout << "  custom flag:  " << f << "\n";
}

static int run_preset(const Settings& settings, const AppConfig& config) {
    PresetStore store(preset_file_of(settings, config), true);

    switch (settings.preset_action) {
        case PresetAction::List:
            for (const auto& name : store.list()) std::cout << name << "\n";
            break;
        case PresetAction::Show:
            print_preset(store.get(settings.preset_name));
            break;
        case PresetAction::Save: {
            Preset p{settings.preset_name, settings.preset_description,
                     layer_flags({}, settings.transcode), settings.preset_ext, settings.preset_suffix};
            store.save(p);
            std::cout << "Saved preset '" << p.name << "'\n";
            break;
        }
        case PresetAction::Delete:
            store.remove(settings.preset_name);
            break;
        case PresetAction::Rename:
            store.rename(settings.preset_name, settings.preset_new_name);
            break;
        case PresetAction::Import:
            for (const auto& name : store.import_from(settings.preset_path)) {
                std::cout << "Imported '" << name << "'\n";
            }
            break;
        case PresetAction::Export:
            store.export_to(settings.preset_path, settings.preset_names);
            break;
    }
    return 0;
}

int main(int argc, char* argv[]) {

    CLI::App app{"vidtool: batch video re-encoding, inspection and renaming on top of ffmpeg."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        const AppConfig config = AppConfig::load(settings.config_path.empty()
                                                     ? std::nullopt
                                                     : std::optional<fs::path>(settings.config_path));
        setup_logging(settings, config);
        init_utf8_locale();

        switch (settings.command) {
            case Command::Reencode: return run_reencode(settings, config);
            case Command::Info:     return run_info(settings, config);
            case Command::Rename:   return run_rename(settings, config);
            case Command::Preset:   return run_preset(settings, config);
            case Command::None:     break;
        }
        return 1;
    } catch (const VidtoolError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unexpected error: ") + e.what(), "main");
        std::cerr << RED << "Unexpected error: " << e.what() << RESET << std::endl;
        return 1;
    }
}
