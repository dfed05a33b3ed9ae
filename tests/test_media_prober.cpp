#include <gtest/gtest.h>

#include "fake_process_runner.hpp"

#include "errors.hpp"
#include "media_prober.hpp"

#include <chrono>
#include <map>
#include <string>

namespace vidtool::tests
{
    namespace
    {
        /// In-memory stamps: a path is "on disk" when it has an entry.
        struct FakeStamps
        {
            std::map<std::filesystem::path, FileStamp> files;

            StampSource source()
            {
                return [this](const std::filesystem::path& p) -> std::optional<FileStamp> {
                    const auto it{ files.find(p.lexically_normal()) };
                    if (it == files.end())
                        return std::nullopt;
                    return it->second;
                };
            }
        };

        FileStamp stamp(std::uintmax_t size, int seconds)
        {
            return FileStamp{ std::filesystem::file_time_type{ std::chrono::seconds{ seconds } }, size };
        }
    } // namespace

    TEST(MediaProber, probeArguments)
    {
        const std::vector<std::string> expected{ "-v", "quiet", "-print_format", "json", "-show_format", "-show_streams", "/a b/c.mkv" };
        EXPECT_EQ(MediaProber::probe_arguments("/a b/c.mkv"), expected);
    }

    TEST(MediaProber, probeParsesToolOutput)
    {
        FakeStamps stamps;
        stamps.files["/videos/a.mkv"] = stamp(10, 1);
        FakeProcessRunner runner{ FakeMediaTools{ .default_media = FakeMedia{ .width = 1280, .height = 720, .vcodec = "hevc" } } };
        MediaProber prober{ runner, "/usr/bin/ffprobe", std::chrono::seconds{ 5 }, stamps.source() };

        const auto d{ prober.probe("/videos/a.mkv") };
        ASSERT_TRUE(d);
        EXPECT_EQ(d->resolution(), "1280x720");
        EXPECT_EQ(d->primary_codec(StreamKind::Video), "hevc");

        const auto requests{ runner.requests() };
        ASSERT_EQ(requests.size(), 1u);
        EXPECT_EQ(requests[0].program, "/usr/bin/ffprobe");
        ASSERT_TRUE(requests[0].timeout);
        EXPECT_EQ(*requests[0].timeout, std::chrono::seconds{ 5 });
    }

    TEST(MediaProber, cacheHitUntilStampChanges)
    {
        FakeStamps stamps;
        stamps.files["/videos/a.mkv"] = stamp(10, 1);
        FakeProcessRunner runner{ FakeMediaTools{} };
        MediaProber prober{ runner, "ffprobe", MediaProber::DEFAULT_TIMEOUT, stamps.source() };

        const auto first{ prober.probe("/videos/a.mkv") };
        const auto second{ prober.probe("/videos/./a.mkv") };
        EXPECT_EQ(first, second);
        EXPECT_EQ(runner.calls_to("ffprobe"), 1u);
        EXPECT_EQ(prober.cache().size(), 1u);

        // modified file
        stamps.files["/videos/a.mkv"] = stamp(10, 2);
        const auto third{ prober.probe("/videos/a.mkv") };
        EXPECT_NE(first, third);
        EXPECT_EQ(runner.calls_to("ffprobe"), 2u);

        prober.cache().invalidate("/videos/a.mkv");
        EXPECT_EQ(prober.cache().size(), 0u);
        prober.probe("/videos/a.mkv");
        EXPECT_EQ(runner.calls_to("ffprobe"), 3u);
    }

    TEST(MediaProber, missingFile)
    {
        FakeStamps stamps;
        FakeProcessRunner runner{ FakeMediaTools{} };
        MediaProber prober{ runner, "ffprobe", MediaProber::DEFAULT_TIMEOUT, stamps.source() };

        try
        {
            prober.probe("/videos/missing.mkv");
            FAIL() << "expected ProbeError";
        }
        catch (const ProbeError& e)
        {
            EXPECT_EQ(e.kind(), ProbeError::Kind::NotFound);
        }
        EXPECT_EQ(runner.calls_to("ffprobe"), 0u);
    }

    TEST(MediaProber, toolFailures)
    {
        struct TestCase
        {
            ProcessOutcome outcome;
            ProbeError::Kind expected;
        } testCases[]{
            { ProcessOutcome{ .exit_code = 1 }, ProbeError::Kind::ToolFailed },
            { ProcessOutcome{ .term_signal = 9 }, ProbeError::Kind::ToolFailed },
            { ProcessOutcome{ .timed_out = true }, ProbeError::Kind::ToolTimeout },
            { ProcessOutcome{ .interrupted = true }, ProbeError::Kind::ToolFailed },
            { ProcessOutcome{ .exit_code = 0, .output = "garbage" }, ProbeError::Kind::MalformedOutput },
        };

        for (const TestCase& testCase : testCases)
        {
            FakeStamps stamps;
            stamps.files["a.mkv"] = stamp(1, 1);
            FakeProcessRunner runner{ [&testCase](const ProcessRequest&, std::stop_token) { return testCase.outcome; } };
            MediaProber prober{ runner, "ffprobe", MediaProber::DEFAULT_TIMEOUT, stamps.source() };

            try
            {
                prober.probe("a.mkv");
                ADD_FAILURE() << "expected ProbeError";
            }
            catch (const ProbeError& e)
            {
                EXPECT_EQ(e.kind(), testCase.expected) << e.what();
            }
            // failures are not cached
            EXPECT_EQ(prober.cache().size(), 0u);
        }
    }
} // namespace vidtool::tests
