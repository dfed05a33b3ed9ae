#include "../../include/renamer.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/path_templater.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace vidtool {

bool is_video_file(const fs::path& path) {
    const std::string ext = to_lower(path.extension().string());
    if (std::ranges::find(VIDEO_EXTENSIONS, ext) != VIDEO_EXTENSIONS.end()) return true;
    return MimeDetector::has_prefix(path, "video/");
}

RenameOutcome rename_with_resolution(MediaProber& prober, const fs::path& file) {
    const auto descriptor = prober.probe(file);

    OutputOptions naming;
    naming.pattern = "{stem}-{resolution}";
    naming.collision = CollisionPolicy::NoClobber;

    const PathResolution target = resolve_output_path(file, *descriptor, naming);

    std::error_code ec;
    fs::rename(file, target.path, ec);
    if (ec) {
        throw JobError(JobError::Kind::OutputWriteFailed,
                       "Cannot rename " + file.string() + " to " + target.path.string() + ": " + ec.message());
    }
    prober.cache().invalidate(fs::absolute(file).lexically_normal());
    Logger::log(LogLevel::Info, "Renamed " + file.string() + " -> " + target.path.filename().string(), "Renamer");
    return {file, target.path, true, {}};
}

std::vector<RenameOutcome> rename_batch(MediaProber& prober, const fs::path& dir, std::stop_token stop) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw SelectionError(SelectionError::Kind::PathNotFound, "Not a directory: " + dir.string());
    }

    std::vector<fs::path> candidates;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_video_file(it->path())) candidates.push_back(it->path());
    }
    std::ranges::sort(candidates);

    std::vector<RenameOutcome> outcomes;
    for (const auto& file : candidates) {
        if (stop.stop_requested()) break;
        try {
            outcomes.push_back(rename_with_resolution(prober, file));
        } catch (const VidtoolError& e) {
            Logger::log(LogLevel::Warning, "Not renamed: " + file.string() + " (" + e.what() + ")", "Renamer");
            outcomes.push_back({file, {}, false, e.what()});
        }
    }
    return outcomes;
}

} // namespace vidtool
