/**
 * @file renamer.hpp
 * @brief Renames video files to carry their resolution in the name.
 */

#ifndef VIDTOOL_RENAMER_HPP
#define VIDTOOL_RENAMER_HPP

#include "media_prober.hpp"

#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace vidtool {

/// Extensions treated as video without looking at the content.
inline const std::vector<std::string> VIDEO_EXTENSIONS = {
    ".avi", ".mpg", ".mkv", ".mp4", ".mov", ".webm", ".wmv", ".m4v", ".ogv", ".divx"
};

struct RenameOutcome {
    std::filesystem::path from;
    std::filesystem::path to;   ///< Empty if no target could be computed
    bool renamed = false;
    std::string detail;         ///< Reason when not renamed
};

/**
 * @brief Recognize a video file by extension, else by a "video/" MIME type.
 */
bool is_video_file(const std::filesystem::path& path);

/**
 * @brief Rename @p file to "{stem}-{W}x{H}{ext}", never overwriting.
 *
 * @throws ProbeError if the file cannot be probed.
 * @throws TemplateError{CollisionDenied} if the target already exists.
 * @throws JobError{OutputWriteFailed} if the rename itself fails.
 */
RenameOutcome rename_with_resolution(MediaProber& prober, const std::filesystem::path& file);

/**
 * @brief Apply rename_with_resolution to every video file under @p dir, recursively.
 *
 * Per-file failures are recorded in the outcome, never thrown.
 * @throws SelectionError{PathNotFound} if @p dir is not a directory.
 */
std::vector<RenameOutcome> rename_batch(MediaProber& prober,
                                        const std::filesystem::path& dir,
                                        std::stop_token stop = {});

} // namespace vidtool

#endif // VIDTOOL_RENAMER_HPP
