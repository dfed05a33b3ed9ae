#ifndef VIDTOOL_TOOL_LOCATOR_HPP
#define VIDTOOL_TOOL_LOCATOR_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace vidtool {

    /**
     * @brief Absolute paths of the external media tools.
     */
    struct ToolPaths {
        std::filesystem::path ffprobe; ///< Probe tool
        std::filesystem::path ffmpeg;  ///< Transcode tool
    };

    /**
     * @brief Locate an executable.
     *
     * A value containing a directory separator is taken as a path and must
     * name an executable regular file. A bare name is searched in $PATH.
     *
     * @param name_or_path "ffmpeg", "/opt/ffmpeg/bin/ffmpeg", ...
     * @return Absolute path, or std::nullopt when nothing executable is found.
     */
    std::optional<std::filesystem::path> find_executable(const std::string& name_or_path);

    /**
     * @brief Resolve both tools up front, before any job is attempted.
     * @throws ProbeError{ToolMissing} when the probe tool is missing.
     * @throws JobError{ToolMissing} when the transcode tool is missing.
     */
    ToolPaths resolve_tool_paths(const std::string& ffprobe, const std::string& ffmpeg);

    /**
     * @brief Resolve the probe tool alone (info, rename).
     * @throws ProbeError{ToolMissing}
     */
    std::filesystem::path resolve_probe_tool(const std::string& ffprobe);

} // namespace vidtool

#endif // VIDTOOL_TOOL_LOCATOR_HPP
