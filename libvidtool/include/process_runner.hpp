/**
 * @file process_runner.hpp
 * @brief Seam between the engine and the external media tools.
 */

#ifndef VIDTOOL_PROCESS_RUNNER_HPP
#define VIDTOOL_PROCESS_RUNNER_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace vidtool {

/**
 * @brief Description of one external tool invocation.
 */
struct ProcessRequest {
    std::filesystem::path program;                  ///< Absolute path of the binary
    std::vector<std::string> args;                  ///< Arguments, without argv[0]
    bool capture_stderr = false;                    ///< Merge stderr into the captured output
    std::optional<std::chrono::milliseconds> timeout; ///< Wall-clock limit, none if empty
    std::function<void(std::string_view)> on_line;  ///< Called for each output line (split on \n and \r)
    std::size_t max_output_bytes = 0;               ///< Keep only the tail of the output; 0 keeps everything
};

/**
 * @brief How an invocation ended.
 */
struct ProcessOutcome {
    int exit_code = -1;       ///< Exit status when the process exited normally
    int term_signal = 0;      ///< Signal number when the process was killed
    bool timed_out = false;   ///< The timeout elapsed and the process was terminated
    bool interrupted = false; ///< A stop was requested and the process was terminated
    std::string output;       ///< Captured output (possibly truncated to its tail)

    [[nodiscard]] bool succeeded() const noexcept {
        return !timed_out && !interrupted && term_signal == 0 && exit_code == 0;
    }
};

/**
 * @brief Runs external programs to completion.
 *
 * Implementations block the calling thread. When @p stop is triggered the
 * running program must be terminated and the outcome flagged interrupted.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    virtual ProcessOutcome run(const ProcessRequest& request, std::stop_token stop) = 0;
};

/**
 * @brief Production runner backed by ChildProcess (fork/exec).
 */
class ChildProcessRunner final : public IProcessRunner {
public:
    ProcessOutcome run(const ProcessRequest& request, std::stop_token stop) override;
};

} // namespace vidtool

#endif // VIDTOOL_PROCESS_RUNNER_HPP
