#include "../../include/tool_locator.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <unistd.h>

#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

namespace vidtool {

    namespace {
        bool is_executable_file(const fs::path& p) {
            std::error_code ec;
            return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
        }
    } // namespace

    std::optional<fs::path> find_executable(const std::string& name_or_path) {
        if (name_or_path.empty()) return std::nullopt;

        if (name_or_path.find('/') != std::string::npos) {
            const fs::path candidate(name_or_path);
            if (!is_executable_file(candidate)) return std::nullopt;
            std::error_code ec;
            auto abs = fs::absolute(candidate, ec);
            return ec ? candidate : abs;
        }

        const char* path_env = std::getenv("PATH");
        if (!path_env) return std::nullopt;

        std::istringstream dirs(path_env);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) dir = ".";
            const fs::path candidate = fs::path(dir) / name_or_path;
            if (is_executable_file(candidate)) {
                std::error_code ec;
                auto abs = fs::absolute(candidate, ec);
                return ec ? candidate : abs;
            }
        }
        return std::nullopt;
    }

    fs::path resolve_probe_tool(const std::string& ffprobe) {
        const auto probe = find_executable(ffprobe);
        if (!probe) {
            throw ProbeError(ProbeError::Kind::ToolMissing,
                             "Probe tool '" + ffprobe + "' not found (install ffmpeg or set --ffprobe)");
        }
        return *probe;
    }

    ToolPaths resolve_tool_paths(const std::string& ffprobe, const std::string& ffmpeg) {
        ToolPaths paths;
        paths.ffprobe = resolve_probe_tool(ffprobe);

        const auto transcode = find_executable(ffmpeg);
        if (!transcode) {
            throw JobError(JobError::Kind::ToolMissing,
                           "Transcode tool '" + ffmpeg + "' not found (install ffmpeg or set --ffmpeg)");
        }
        paths.ffmpeg = *transcode;

        Logger::log(LogLevel::Debug, "Using ffprobe at " + paths.ffprobe.string() +
                    ", ffmpeg at " + paths.ffmpeg.string(), "ToolLocator");
        return paths;
    }

} // namespace vidtool
