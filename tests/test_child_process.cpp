#include <gtest/gtest.h>

#include "child_process.hpp"
#include "process_runner.hpp"

#include <chrono>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace vidtool::tests
{
    namespace
    {
        ProcessRequest shell(const std::string& script)
        {
            ProcessRequest request;
            request.program = "/bin/sh";
            request.args = { "-c", script };
            return request;
        }
    } // namespace

    TEST(ChildProcess, capturesOutputAndExitCode)
    {
        ChildProcessRunner runner;
        const ProcessOutcome outcome{ runner.run(shell("echo hello; echo world; exit 3"), {}) };

        EXPECT_EQ(outcome.exit_code, 3);
        EXPECT_EQ(outcome.term_signal, 0);
        EXPECT_FALSE(outcome.timed_out);
        EXPECT_FALSE(outcome.interrupted);
        EXPECT_FALSE(outcome.succeeded());
        EXPECT_EQ(outcome.output, "hello\nworld\n");
    }

    TEST(ChildProcess, stderrOnlyWhenRequested)
    {
        ChildProcessRunner runner;

        const ProcessOutcome without{ runner.run(shell("echo out; echo err 1>&2"), {}) };
        EXPECT_TRUE(without.succeeded());
        EXPECT_EQ(without.output, "out\n");

        ProcessRequest request{ shell("echo err 1>&2") };
        request.capture_stderr = true;
        const ProcessOutcome with{ runner.run(request, {}) };
        EXPECT_TRUE(with.succeeded());
        EXPECT_EQ(with.output, "err\n");
    }

    TEST(ChildProcess, linesSplitOnCarriageReturn)
    {
        ChildProcessRunner runner;
        std::vector<std::string> lines;

        ProcessRequest request{ shell("printf 'frame=1 time=00:00:01.00\\rframe=2 time=00:00:02.00\\rdone\\n'") };
        request.on_line = [&lines](std::string_view line) { lines.emplace_back(line); };
        const ProcessOutcome outcome{ runner.run(request, {}) };

        EXPECT_TRUE(outcome.succeeded());
        const std::vector<std::string> expected{ "frame=1 time=00:00:01.00", "frame=2 time=00:00:02.00", "done" };
        EXPECT_EQ(lines, expected);
    }

    TEST(ChildProcess, outputKeepsTail)
    {
        ChildProcessRunner runner;
        ProcessRequest request{ shell("printf 'abcdefghij'") };
        request.max_output_bytes = 4;

        const ProcessOutcome outcome{ runner.run(request, {}) };
        EXPECT_EQ(outcome.output, "ghij");
    }

    TEST(ChildProcess, timeoutTerminates)
    {
        ChildProcessRunner runner;
        ProcessRequest request{ shell("sleep 10") };
        request.timeout = std::chrono::milliseconds{ 200 };

        const auto start{ std::chrono::steady_clock::now() };
        const ProcessOutcome outcome{ runner.run(request, {}) };

        EXPECT_TRUE(outcome.timed_out);
        EXPECT_FALSE(outcome.succeeded());
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{ 8 });
    }

    TEST(ChildProcess, stopRequestInterrupts)
    {
        ChildProcessRunner runner;
        std::stop_source stop;

        std::jthread stopper{ [&stop] {
            std::this_thread::sleep_for(std::chrono::milliseconds{ 200 });
            stop.request_stop();
        } };
        const ProcessOutcome outcome{ runner.run(shell("sleep 10"), stop.get_token()) };

        EXPECT_TRUE(outcome.interrupted);
        EXPECT_FALSE(outcome.succeeded());
    }

    TEST(ChildProcess, missingProgramExits127)
    {
        ChildProcessRunner runner;
        ProcessRequest request;
        request.program = "/nonexistent/vidtool-no-such-tool";

        const ProcessOutcome outcome{ runner.run(request, {}) };
        EXPECT_EQ(outcome.exit_code, 127);
    }
} // namespace vidtool::tests
