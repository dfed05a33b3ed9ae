#include "../../include/selector.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace vidtool {

namespace {
    std::string glob_to_regex(const std::string& glob) {
        std::string re;
        re.reserve(glob.size() * 2);
        for (std::size_t i = 0; i < glob.size(); ++i) {
            const char c = glob[i];
            switch (c) {
                case '*': re += ".*"; break;
                case '?': re += '.'; break;
                case '[': {
                    const auto close = glob.find(']', i + 2);
                    if (close == std::string::npos) {
                        re += "\\[";
                        break;
                    }
                    std::string cls = glob.substr(i + 1, close - i - 1);
                    if (!cls.empty() && cls[0] == '!') cls[0] = '^';
                    re += '[';
                    for (const char k : cls) {
                        if (k == '\\') re += '\\';
                        re += k;
                    }
                    re += ']';
                    i = close;
                    break;
                }
                case '.': case '(': case ')': case '+': case '|': case '^':
                case '$': case '{': case '}': case '\\': case ']':
                    re += '\\';
                    re += c;
                    break;
                default:
                    re += c;
            }
        }
        return re;
    }

    std::string extension_key(const std::string& ext) {
        std::string out = to_lower(ext);
        if (!out.empty() && out.front() != '.') out.insert(out.begin(), '.');
        return out;
    }

    bool any_codec_in(const MediaDescriptor& d, const StreamKind kind, const std::set<std::string>& wanted) {
        for (const auto* s : d.streams_of(kind)) {
            if (wanted.contains(to_lower(s->codec_name))) return true;
        }
        return false;
    }

    std::set<std::string> lowered(const std::set<std::string>& values) {
        std::set<std::string> out;
        for (const auto& v : values) out.insert(to_lower(v));
        return out;
    }

    std::vector<fs::path> list_root(const fs::path& root, const int depth, std::stop_token stop) {
        std::vector<fs::path> files;
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            files.push_back(root);
            return files;
        }
        if (!fs::is_directory(root, ec)) return files;

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Cannot list " + root.string() + " (" + ec.message() + ")", "Selector");
            return files;
        }
        for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                Logger::log(LogLevel::Warning, "Directory walk error under " + root.string() + ": " + ec.message(), "Selector");
                break;
            }
            if (stop.stop_requested()) break;

            std::error_code type_ec;
            if (it->is_directory(type_ec)) {
                if (depth >= 0 && it.depth() >= depth) it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file(type_ec)) files.push_back(it->path());
        }
        std::ranges::sort(files);
        return files;
    }
} // namespace

bool SelectionCriteria::needs_probe() const noexcept {
    return !video_codecs.empty() || !audio_codecs.empty() || width.is_set() || height.is_set()
        || duration_seconds.is_set();
}

std::regex compile_name_pattern(const NamePattern& pattern) {
    try {
        if (pattern.kind == NamePattern::Kind::Glob) {
            return std::regex(glob_to_regex(pattern.text), std::regex::ECMAScript | std::regex::icase);
        }
        return std::regex(pattern.text, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw SelectionError(SelectionError::Kind::BadPattern,
                             "Invalid pattern '" + pattern.text + "': " + e.what());
    }
}

bool matches_name(const std::regex& re, const NamePattern::Kind kind, const std::string& file_name) {
    return kind == NamePattern::Kind::Glob ? std::regex_match(file_name, re) : std::regex_search(file_name, re);
}

Selector::Selector(MediaProber& prober, EventBus* bus) : prober_(prober), bus_(bus) {}

SelectionResult Selector::select(const std::vector<fs::path>& roots,
                                 const SelectionCriteria& criteria,
                                 const int depth,
                                 std::stop_token stop) {
    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            throw SelectionError(SelectionError::Kind::PathNotFound, "Path does not exist: " + root.string());
        }
    }

    std::optional<std::regex> include;
    if (criteria.pattern) include = compile_name_pattern(*criteria.pattern);
    std::vector<std::pair<std::regex, NamePattern::Kind>> excludes;
    for (const auto& p : criteria.exclude) excludes.emplace_back(compile_name_pattern(p), p.kind);

    std::set<std::string> extensions;
    for (const auto& e : criteria.extensions) extensions.insert(extension_key(e));
    const auto video_codecs = lowered(criteria.video_codecs);
    const auto audio_codecs = lowered(criteria.audio_codecs);

    SelectionResult result;
    std::unordered_set<std::string> seen;

    for (const auto& root : roots) {
        for (const auto& file : list_root(root, depth, stop)) {
            if (stop.stop_requested()) return result;

            const std::string name = file.filename().string();
            if (include && !matches_name(*include, criteria.pattern->kind, name)) continue;
            if (std::ranges::any_of(excludes, [&name](const auto& ex) { return matches_name(ex.first, ex.second, name); })) {
                continue;
            }
            if (!extensions.empty() && !extensions.contains(to_lower(file.extension().string()))) continue;

            if (criteria.size_bytes.is_set()) {
                std::error_code ec;
                const auto size = fs::file_size(file, ec);
                if (ec || !criteria.size_bytes.contains(size)) continue;
            }

            if (!criteria.mime_prefixes.empty()
                && std::ranges::none_of(criteria.mime_prefixes, [&file](const std::string& prefix) {
                       return MimeDetector::has_prefix(file, prefix);
                   })) {
                continue;
            }

            if (criteria.needs_probe()) {
                std::shared_ptr<const MediaDescriptor> d;
                try {
                    d = prober_.probe(file, stop);
                } catch (const ProbeError& e) {
                    Logger::log(LogLevel::Warning, "Skipping " + file.string() + ": " + e.what(), "Selector");
                    result.warnings.push_back({file, e.what()});
                    if (bus_) bus_->publish(SelectionWarningEvent{file, e.what()});
                    continue;
                }
                if (!video_codecs.empty() && !any_codec_in(*d, StreamKind::Video, video_codecs)) continue;
                if (!audio_codecs.empty() && !any_codec_in(*d, StreamKind::Audio, audio_codecs)) continue;
                if (criteria.width.is_set() && !criteria.width.contains(d->max_width())) continue;
                if (criteria.height.is_set() && !criteria.height.contains(d->max_height())) continue;
                if (criteria.duration_seconds.is_set() && !criteria.duration_seconds.contains(d->duration_seconds)) continue;
            }

            std::error_code ec;
            const fs::path canonical = fs::weakly_canonical(file, ec);
            if (!seen.insert(ec ? file.string() : canonical.string()).second) continue;
            result.files.push_back(file);
        }
    }

    Logger::log(LogLevel::Info,
                "Selected " + std::to_string(result.files.size()) + " file(s), "
                + std::to_string(result.warnings.size()) + " warning(s)", "Selector");
    return result;
}

} // namespace vidtool
