#ifndef VIDTOOL_TESTS_FAKE_PROCESS_RUNNER_HPP
#define VIDTOOL_TESTS_FAKE_PROCESS_RUNNER_HPP

#include "process_runner.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace vidtool::tests
{
    /**
     * @brief Properties of a fake media file, rendered as probe tool JSON.
     */
    struct FakeMedia {
        int width = 1920;
        int height = 1080;
        std::string vcodec = "h264";
        std::string acodec = "aac";   ///< Empty: no audio stream
        double duration = 60.0;
        bool subtitles = false;
        bool data = false;
        bool video = true;
    };

    /// JSON as printed by `ffprobe -print_format json -show_format -show_streams`.
    std::string probe_json(const FakeMedia& media);

    /**
     * @brief IProcessRunner that records requests and answers from a handler.
     */
    class FakeProcessRunner final : public IProcessRunner {
    public:
        using Handler = std::function<ProcessOutcome(const ProcessRequest&, std::stop_token)>;

        explicit FakeProcessRunner(Handler handler = {}) : handler_(std::move(handler)) {}

        ProcessOutcome run(const ProcessRequest& request, std::stop_token stop) override;

        void set_handler(Handler handler);

        [[nodiscard]] std::vector<ProcessRequest> requests() const;

        /// Number of runs whose program file name is @p name.
        [[nodiscard]] std::size_t calls_to(const std::string& name) const;

    private:
        mutable std::mutex mtx_;
        Handler handler_;
        std::vector<ProcessRequest> requests_;
    };

    /**
     * @brief Handler that behaves like ffprobe and ffmpeg on real files.
     *
     * ffprobe answers from @ref media (by file name) or @ref default_media.
     * ffmpeg writes a small file at its output argument, unless the input
     * file name is in @ref failing.
     */
    struct FakeMediaTools {
        FakeMedia default_media;
        std::map<std::string, FakeMedia> media;
        std::set<std::string> unprobeable;
        std::set<std::string> failing;
        std::vector<std::string> progress_lines;

        ProcessOutcome operator()(const ProcessRequest& request, std::stop_token stop) const;
    };

    /**
     * @brief Fresh directory under the system temp dir, removed on destruction.
     */
    class [[nodiscard]] ScopedTempDir {
    public:
        ScopedTempDir();
        ~ScopedTempDir();

        ScopedTempDir(const ScopedTempDir&) = delete;
        ScopedTempDir& operator=(const ScopedTempDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const { return _path; }

        /// Create @p relative (and its parents) with @p content, return its full path.
        std::filesystem::path write(const std::filesystem::path& relative, const std::string& content = "data") const;

    private:
        std::filesystem::path _path;
    };
} // namespace vidtool::tests

#endif // VIDTOOL_TESTS_FAKE_PROCESS_RUNNER_HPP
