#ifndef VIDTOOL_FILE_UTILS_HPP
#define VIDTOOL_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace vidtool {

    /**
     * @brief Build a unique, not yet existing path next to @p target.
     *
     * The extension of @p target is kept (the transcode tool picks the
     * container from it): "dir/.movie.vidtool-1a2b3c4d.mkv".
     */
    std::filesystem::path make_temp_sibling(const std::filesystem::path& target);

    /**
     * @brief Remove a file, logging instead of throwing on failure.
     */
    void remove_quietly(const std::filesystem::path& path, std::string_view tag);

    /**
     * @brief Replace @p target by @p temp (same filesystem), copying as a fallback.
     * @return Empty string on success, else a description of the failure.
     */
    std::string move_into_place(const std::filesystem::path& temp, const std::filesystem::path& target);

    /**
     * @brief Lowercase ASCII copy of @p s.
     */
    std::string to_lower(std::string_view s);

} // namespace vidtool

#endif // VIDTOOL_FILE_UTILS_HPP
