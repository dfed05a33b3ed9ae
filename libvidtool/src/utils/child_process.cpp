#include "../../include/child_process.hpp"
#include "../../include/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <mutex>
#include <system_error>
#include <thread>

namespace vidtool {

    namespace {
        constexpr auto kTerminateGrace = std::chrono::seconds(3);
        constexpr int kPollIntervalMs = 100;

        std::string system_message(const std::string& what) {
            return what + ": " + std::error_code{errno, std::generic_category()}.message();
        }

        // splits a stream of chunks into lines on '\n' or '\r' (ffmpeg rewrites
        // its status line with carriage returns)
        class LineSplitter {
        public:
            explicit LineSplitter(const std::function<void(std::string_view)>& sink) : sink_(sink) {}

            void feed(const std::string_view chunk) {
                if (!sink_) return;
                for (const char c : chunk) {
                    if (c == '\n' || c == '\r') {
                        flush();
                    } else {
                        pending_.push_back(c);
                    }
                }
            }

            void flush() {
                if (sink_ && !pending_.empty()) {
                    sink_(pending_);
                }
                pending_.clear();
            }

        private:
            const std::function<void(std::string_view)>& sink_;
            std::string pending_;
        };
    } // namespace

    ChildProcess::ChildProcess(const std::filesystem::path& program, const Args& args, const bool capture_stderr) {
        // argv is prepared before fork: only async-signal-safe calls in the child
        const std::string program_str = program.string();
        std::vector<const char*> exec_args;
        exec_args.reserve(args.size() + 2);
        exec_args.push_back(program_str.c_str());
        for (const auto& arg : args) {
            exec_args.push_back(arg.c_str());
        }
        exec_args.push_back(nullptr);

        // pipe creation and fork must not interleave with another spawn, or a
        // sibling child could inherit our write end and keep the pipe open
        static std::mutex spawn_mutex;
        const std::scoped_lock lock{spawn_mutex};

        int pipefd[2];
        if (pipe(pipefd) == -1)
            throw ChildProcessError(system_message("pipe failed"));

        if (fcntl(pipefd[0], F_SETFD, FD_CLOEXEC) == -1 || fcntl(pipefd[1], F_SETFD, FD_CLOEXEC) == -1) {
            const std::string msg = system_message("fcntl failed to set FD_CLOEXEC");
            close(pipefd[0]);
            close(pipefd[1]);
            throw ChildProcessError(msg);
        }

        const pid_t res = fork();
        if (res == -1) {
            const std::string msg = system_message("fork failed");
            close(pipefd[0]);
            close(pipefd[1]);
            throw ChildProcessError(msg);
        }

        if (res == 0) { // CHILD
            const int null_fd = open("/dev/null", O_RDWR);
            if (null_fd != -1) {
                dup2(null_fd, STDIN_FILENO);
                if (!capture_stderr)
                    dup2(null_fd, STDERR_FILENO);
                close(null_fd);
            }
            if (dup2(pipefd[1], STDOUT_FILENO) == -1)
                _exit(127);
            if (capture_stderr && dup2(pipefd[1], STDERR_FILENO) == -1)
                _exit(127);
            close(pipefd[0]);
            close(pipefd[1]);

            execv(exec_args[0], const_cast<char* const*>(exec_args.data()));
            _exit(127);
        }

        // PARENT
        close(pipefd[1]);
        stdout_fd_ = pipefd[0];
        pid_ = res;
        Logger::log(LogLevel::Debug, "Spawned " + program_str + " (pid " + std::to_string(pid_) + ")", "ChildProcess");
    }

    ChildProcess::~ChildProcess() {
        close_pipe();
        if (pid_ > 0 && !reaped_) {
            kill(pid_, SIGKILL);
            try_reap(true);
        }
    }

    void ChildProcess::close_pipe() noexcept {
        if (stdout_fd_ != -1) {
            close(stdout_fd_);
            stdout_fd_ = -1;
        }
    }

    bool ChildProcess::try_reap(const bool block) {
        if (reaped_) return true;
        for (;;) {
            int status = 0;
            const pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
            if (r == pid_) {
                raw_status_ = status;
                reaped_ = true;
                return true;
            }
            if (r == 0) return false;
            if (errno == EINTR) continue;
            // ECHILD: someone else reaped it, nothing more to learn
            Logger::log(LogLevel::Warning, system_message("waitpid failed"), "ChildProcess");
            reaped_ = true;
            raw_status_ = 0;
            return true;
        }
    }

    void ChildProcess::terminate() {
        if (pid_ <= 0 || reaped_) return;
        Logger::log(LogLevel::Debug, "Terminating pid " + std::to_string(pid_), "ChildProcess");
        kill(pid_, SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (try_reap(false)) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        kill(pid_, SIGKILL);
        try_reap(true);
    }

    ProcessOutcome ChildProcess::wait(std::stop_token stop,
                                      const std::optional<std::chrono::milliseconds> timeout,
                                      const std::function<void(std::string_view)>& on_line,
                                      const std::size_t max_output_bytes) {
        ProcessOutcome outcome;
        LineSplitter splitter(on_line);
        const auto start = std::chrono::steady_clock::now();

        auto should_abort = [&] {
            if (stop.stop_requested()) {
                outcome.interrupted = true;
                return true;
            }
            if (timeout && std::chrono::steady_clock::now() - start >= *timeout) {
                outcome.timed_out = true;
                return true;
            }
            return false;
        };

        char buf[4096];
        while (stdout_fd_ != -1) {
            if (should_abort()) {
                terminate();
                break;
            }
            pollfd pfd{stdout_fd_, POLLIN, 0};
            const int pr = poll(&pfd, 1, kPollIntervalMs);
            if (pr == -1) {
                if (errno == EINTR) continue;
                Logger::log(LogLevel::Warning, system_message("poll failed"), "ChildProcess");
                break;
            }
            if (pr == 0) continue;

            const ssize_t n = read(stdout_fd_, buf, sizeof(buf));
            if (n > 0) {
                const std::string_view chunk(buf, static_cast<std::size_t>(n));
                outcome.output.append(chunk);
                if (max_output_bytes > 0 && outcome.output.size() > max_output_bytes) {
                    outcome.output.erase(0, outcome.output.size() - max_output_bytes);
                }
                splitter.feed(chunk);
            } else if (n == 0) {
                break; // EOF
            } else if (errno != EINTR && errno != EAGAIN) {
                Logger::log(LogLevel::Warning, system_message("read failed"), "ChildProcess");
                break;
            }
        }
        splitter.flush();
        close_pipe();

        // the child may close stdout before exiting
        while (!try_reap(false)) {
            if (should_abort()) {
                terminate();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (WIFEXITED(raw_status_)) {
            outcome.exit_code = WEXITSTATUS(raw_status_);
        } else if (WIFSIGNALED(raw_status_)) {
            outcome.term_signal = WTERMSIG(raw_status_);
        }
        return outcome;
    }

    ProcessOutcome ChildProcessRunner::run(const ProcessRequest& request, std::stop_token stop) {
        ChildProcess child(request.program, request.args, request.capture_stderr);
        return child.wait(stop, request.timeout, request.on_line, request.max_output_bytes);
    }

} // namespace vidtool
