#include "../../include/preset_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

namespace vidtool {

namespace {
    bool is_blank(const std::string& s) {
        return std::ranges::all_of(s, [](const unsigned char c) { return std::isspace(c) != 0; });
    }

    pt::ptree options_to_tree(const TranscodeOptions& o) {
        pt::ptree node;
        if (o.video_codec) node.put("video_codec", *o.video_codec);
        if (o.audio_codec) node.put("audio_codec", *o.audio_codec);
        node.put("strip_video", o.strip_video);
        node.put("strip_audio", o.strip_audio);
        node.put("strip_subtitles", o.strip_subtitles);
        node.put("strip_data", o.strip_data);
        node.put("av_copy_only", o.av_copy_only);
        node.put("x265", o.x265);
        if (o.crf) node.put("crf", *o.crf);
        node.put("fix_resolution", o.fix_resolution);
        node.put("fix_errors", o.fix_errors);
        pt::ptree flags;
        for (const auto& f : o.custom_flags) {
            pt::ptree item;
            item.put_value(f);
            flags.push_back({"", item});
        }
        // property_tree writes an empty array as ""
        if (!flags.empty()) node.add_child("custom_flags", flags);
        return node;
    }

    TranscodeOptions options_from_tree(const pt::ptree& node) {
        TranscodeOptions o;
        if (auto v = node.get_optional<std::string>("video_codec")) o.video_codec = *v;
        if (auto v = node.get_optional<std::string>("audio_codec")) o.audio_codec = *v;
        o.strip_video = node.get<bool>("strip_video", false);
        o.strip_audio = node.get<bool>("strip_audio", false);
        o.strip_subtitles = node.get<bool>("strip_subtitles", false);
        o.strip_data = node.get<bool>("strip_data", false);
        o.av_copy_only = node.get<bool>("av_copy_only", false);
        o.x265 = node.get<bool>("x265", false);
        if (auto v = node.get_optional<int>("crf")) o.crf = *v;
        o.fix_resolution = node.get<bool>("fix_resolution", false);
        o.fix_errors = node.get<bool>("fix_errors", false);
        if (const auto flags = node.get_child_optional("custom_flags")) {
            for (const auto& [key, item] : *flags) o.custom_flags.push_back(item.get_value<std::string>());
        }
        return o;
    }

    pt::ptree preset_to_tree(const Preset& p) {
        pt::ptree node = options_to_tree(p.options);
        node.put("description", p.description);
        if (!p.output_extension.empty()) node.put("output_extension", p.output_extension);
        if (!p.output_suffix.empty()) node.put("output_suffix", p.output_suffix);
        return node;
    }

    Preset preset_from_tree(const std::string& name, const pt::ptree& node) {
        Preset p;
        p.name = name;
        p.description = node.get<std::string>("description", "");
        p.output_extension = node.get<std::string>("output_extension", "");
        p.output_suffix = node.get<std::string>("output_suffix", "");
        p.options = options_from_tree(node);
        return p;
    }

    // Children are iterated instead of addressed by path: names may contain '.'
    std::vector<Preset> read_document(const fs::path& path) {
        pt::ptree root;
        try {
            pt::read_json(path.string(), root);
        } catch (const pt::ptree_error& e) {
            throw PresetError(PresetError::Kind::Unreadable, "Cannot read presets from " + path.string() + ": " + e.what());
        }

        const auto version = root.get<std::string>("version", "");
        if (version != PresetStore::FORMAT_VERSION) {
            Logger::log(LogLevel::Warning, "Preset file " + path.string() + " has version '" + version + "'", "Presets");
        }
        const auto presets = root.get_child_optional("presets");
        if (!presets) {
            throw PresetError(PresetError::Kind::Unreadable, "No presets section in " + path.string());
        }

        std::vector<Preset> out;
        try {
            for (const auto& [name, node] : *presets) out.push_back(preset_from_tree(name, node));
        } catch (const pt::ptree_error& e) {
            throw PresetError(PresetError::Kind::Unreadable, "Invalid preset in " + path.string() + ": " + e.what());
        }
        return out;
    }

    void write_document(const fs::path& path, const std::vector<const Preset*>& presets) {
        pt::ptree root;
        root.put("version", std::string(PresetStore::FORMAT_VERSION));
        pt::ptree children;
        for (const auto* p : presets) children.push_back({p->name, preset_to_tree(*p)});
        root.add_child("presets", children);

        std::error_code ec;
        if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

        const fs::path temp = make_temp_sibling(path);
        try {
            std::ofstream out(temp);
            if (!out) throw PresetError(PresetError::Kind::WriteFailed, "Cannot open " + temp.string());
            pt::write_json(out, root, true);
            out.close();
            if (!out) throw PresetError(PresetError::Kind::WriteFailed, "Cannot write " + temp.string());
        } catch (const pt::ptree_error& e) {
            remove_quietly(temp, "Presets");
            throw PresetError(PresetError::Kind::WriteFailed, "Cannot write " + path.string() + ": " + e.what());
        } catch (const PresetError&) {
            remove_quietly(temp, "Presets");
            throw;
        }

        fs::rename(temp, path, ec);
        if (ec) {
            remove_quietly(temp, "Presets");
            throw PresetError(PresetError::Kind::WriteFailed, "Cannot replace " + path.string() + ": " + ec.message());
        }
    }

    void check_name(const std::string& name) {
        if (name.empty() || is_blank(name)) {
            throw PresetError(PresetError::Kind::InvalidName, "Preset name cannot be empty");
        }
    }
} // namespace

PresetStore::PresetStore(fs::path file, const bool seed_defaults) : file_(std::move(file)) {
    std::error_code ec;
    if (fs::exists(file_, ec)) {
        for (auto& p : read_document(file_)) {
            auto name = p.name;
            presets_.emplace(std::move(name), std::move(p));
        }
        Logger::log(LogLevel::Debug, "Loaded " + std::to_string(presets_.size()) + " preset(s) from " + file_.string(), "Presets");
        return;
    }
    if (seed_defaults) {
        std::map<std::string, Preset> seeded;
        for (auto& p : default_presets()) {
            auto name = p.name;
            seeded.emplace(std::move(name), std::move(p));
        }
        commit_locked(std::move(seeded));
        Logger::log(LogLevel::Info, "Created default presets in " + file_.string(), "Presets");
    }
}

void PresetStore::save(const std::string& name, const TranscodeOptions& options) {
    Preset p;
    p.name = name;
    p.options = options;
    {
        std::lock_guard lock(mtx_);
        if (const auto it = presets_.find(name); it != presets_.end()) {
            p.description = it->second.description;
            p.output_extension = it->second.output_extension;
            p.output_suffix = it->second.output_suffix;
        }
    }
    save(p);
}

void PresetStore::save(const Preset& preset) {
    check_name(preset.name);
    preset.options.validate();

    std::lock_guard lock(mtx_);
    auto next = presets_;
    next[preset.name] = preset;
    commit_locked(std::move(next));
}

TranscodeOptions PresetStore::load(const std::string& name) const {
    return get(name).options;
}

Preset PresetStore::get(const std::string& name) const {
    std::lock_guard lock(mtx_);
    const auto it = presets_.find(name);
    if (it == presets_.end()) {
        throw PresetError(PresetError::Kind::NotFound, "Preset '" + name + "' not found");
    }
    return it->second;
}

std::set<std::string> PresetStore::list() const {
    std::lock_guard lock(mtx_);
    std::set<std::string> names;
    for (const auto& [name, preset] : presets_) names.insert(name);
    return names;
}

bool PresetStore::contains(const std::string& name) const {
    std::lock_guard lock(mtx_);
    return presets_.contains(name);
}

void PresetStore::remove(const std::string& name) {
    std::lock_guard lock(mtx_);
    if (!presets_.contains(name)) return;
    auto next = presets_;
    next.erase(name);
    commit_locked(std::move(next));
}

void PresetStore::rename(const std::string& from, const std::string& to) {
    check_name(to);
    std::lock_guard lock(mtx_);
    const auto it = presets_.find(from);
    if (it == presets_.end()) {
        throw PresetError(PresetError::Kind::NotFound, "Preset '" + from + "' not found");
    }
    if (from == to) return;
    if (presets_.contains(to)) {
        throw PresetError(PresetError::Kind::AlreadyExists, "Preset '" + to + "' already exists");
    }
    auto next = presets_;
    auto node = next.extract(from);
    node.key() = to;
    node.mapped().name = to;
    next.insert(std::move(node));
    commit_locked(std::move(next));
}

void PresetStore::export_to(const fs::path& path, const std::vector<std::string>& names) const {
    std::lock_guard lock(mtx_);
    std::vector<const Preset*> selected;
    if (names.empty()) {
        for (const auto& [name, preset] : presets_) selected.push_back(&preset);
    } else {
        for (const auto& name : names) {
            const auto it = presets_.find(name);
            if (it == presets_.end()) {
                throw PresetError(PresetError::Kind::NotFound, "Preset '" + name + "' not found");
            }
            selected.push_back(&it->second);
        }
    }
    write_document(path, selected);
    Logger::log(LogLevel::Info, "Exported " + std::to_string(selected.size()) + " preset(s) to " + path.string(), "Presets");
}

std::vector<std::string> PresetStore::import_from(const fs::path& path) {
    auto incoming = read_document(path);

    std::lock_guard lock(mtx_);
    auto next = presets_;
    std::vector<std::string> imported;
    for (auto& p : incoming) {
        try {
            check_name(p.name);
            p.options.validate();
        } catch (const VidtoolError& e) {
            Logger::log(LogLevel::Warning, "Skipping preset '" + p.name + "': " + e.what(), "Presets");
            continue;
        }
        std::string name = p.name;
        for (int n = 1; next.contains(name); ++n) {
            name = p.name + " (" + std::to_string(n) + ")";
        }
        p.name = name;
        next.emplace(name, std::move(p));
        imported.push_back(std::move(name));
    }
    if (!imported.empty()) commit_locked(std::move(next));
    Logger::log(LogLevel::Info, "Imported " + std::to_string(imported.size()) + " preset(s) from " + path.string(), "Presets");
    return imported;
}

void PresetStore::commit_locked(std::map<std::string, Preset> next) {
    std::vector<const Preset*> all;
    all.reserve(next.size());
    for (const auto& [name, preset] : next) all.push_back(&preset);
    write_document(file_, all);
    presets_ = std::move(next);
}

std::vector<Preset> PresetStore::default_presets() {
    const auto x265 = [](const int crf, const bool fix_resolution, const bool strip_data, const bool strip_subtitles) {
        TranscodeOptions o;
        o.video_codec = std::string(X265_CODEC);
        o.audio_codec = std::string(COPY_CODEC);
        o.crf = crf;
        o.fix_resolution = fix_resolution;
        o.strip_data = strip_data;
        o.strip_subtitles = strip_subtitles;
        return o;
    };

    TranscodeOptions h264;
    h264.video_codec = "libx264";
    h264.audio_codec = "aac";
    h264.crf = 23;
    h264.fix_resolution = true;
    h264.strip_data = true;

    TranscodeOptions audio_aac;
    audio_aac.video_codec = std::string(COPY_CODEC);
    audio_aac.audio_codec = "aac";
    audio_aac.strip_data = true;

    return {
        {"H.265 High Quality", "High quality H.265 encoding with CRF 18", x265(18, true, true, false), ".mkv", "_h265_hq"},
        {"H.265 Balanced", "Balanced H.265 encoding with CRF 23", x265(23, true, true, false), ".mkv", "_h265"},
        {"H.265 Small Size", "Smaller file size H.265 encoding with CRF 28", x265(28, true, true, true), ".mkv", "_small"},
        {"H.264 Compatible", "H.264 encoding for maximum compatibility", h264, ".mp4", "_h264"},
        {"Copy Video + Convert Audio", "Copy video stream, convert audio to AAC", audio_aac, ".mkv", "_audio_aac"},
        {"Archive Quality", "Lossless/near-lossless archival quality", x265(12, false, false, false), ".mkv", "_archive"},
    };
}

fs::path PresetStore::default_location() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "vidtool" / "presets.json";
    }
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / ".config" / "vidtool" / "presets.json";
}

} // namespace vidtool
