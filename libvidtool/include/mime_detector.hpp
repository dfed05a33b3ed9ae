#ifndef VIDTOOL_MIME_DETECTOR_HPP
#define VIDTOOL_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace vidtool {

    /**
     * @brief Content-based file type detection backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A string representing the MIME type (e.g., "video/x-matroska"),
         *         empty if the magic database is unavailable or the file unreadable.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Check whether a file's MIME type starts with @p prefix.
         *
         * The comparison is case-insensitive; "video/" matches "video/mp4".
         */
        static bool has_prefix(const std::filesystem::path& path, std::string_view prefix);
    };

} // namespace vidtool
#endif // VIDTOOL_MIME_DETECTOR_HPP
