/**
 * @file child_process.hpp
 * @brief POSIX child process with captured output.
 */

#ifndef VIDTOOL_CHILD_PROCESS_HPP
#define VIDTOOL_CHILD_PROCESS_HPP

#include "errors.hpp"
#include "process_runner.hpp"
#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace vidtool {

/**
 * @brief Raised when the process cannot be created (pipe, fork).
 */
class ChildProcessError : public VidtoolError {
public:
    using VidtoolError::VidtoolError;
};

/**
 * @brief One spawned external program.
 *
 * @details The child gets /dev/null as stdin so tools such as ffmpeg never
 * block on an interactive question. stdout (and optionally stderr) is read
 * through a pipe by wait(). The destructor kills and reaps a child that is
 * still running, so no zombie outlives the object.
 */
class ChildProcess {
public:
    using Args = std::vector<std::string>;

    /**
     * @brief Spawn @p program with @p args.
     * @param program Absolute path of the executable.
     * @param args Arguments, argv[0] excluded.
     * @param capture_stderr Redirect stderr into the captured pipe too.
     * @throws ChildProcessError if the pipe or the fork fails.
     */
    ChildProcess(const std::filesystem::path& program, const Args& args, bool capture_stderr);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Read output until the child exits, then reap it.
     * @param stop Terminates the child when triggered.
     * @param timeout Terminates the child when elapsed.
     * @param on_line Optional per-line callback.
     * @param max_output_bytes Retained output size, 0 for unbounded.
     */
    ProcessOutcome wait(std::stop_token stop,
                        std::optional<std::chrono::milliseconds> timeout,
                        const std::function<void(std::string_view)>& on_line,
                        std::size_t max_output_bytes);

    /**
     * @brief SIGTERM, then SIGKILL if the child is still alive after a grace period.
     */
    void terminate();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    bool try_reap(bool block);
    void close_pipe() noexcept;

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    bool reaped_ = false;
    int raw_status_ = 0;
};

} // namespace vidtool

#endif // VIDTOOL_CHILD_PROCESS_HPP
