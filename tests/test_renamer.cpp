#include <gtest/gtest.h>

#include "fake_process_runner.hpp"

#include "errors.hpp"
#include "renamer.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace vidtool::tests
{
    TEST(Renamer, appendsResolution)
    {
        ScopedTempDir dir;
        const fs::path file{ dir.write("movie.mkv") };

        FakeMediaTools tools;
        tools.default_media = FakeMedia{ .width = 1280, .height = 720 };
        FakeProcessRunner runner{ tools };
        MediaProber prober{ runner, "ffprobe" };

        const RenameOutcome outcome{ rename_with_resolution(prober, file) };
        EXPECT_TRUE(outcome.renamed);
        EXPECT_EQ(outcome.to, dir.path() / "movie-1280x720.mkv");
        EXPECT_FALSE(fs::exists(file));
        EXPECT_TRUE(fs::exists(outcome.to));
    }

    TEST(Renamer, neverOverwrites)
    {
        ScopedTempDir dir;
        const fs::path file{ dir.write("movie.mkv") };
        dir.write("movie-1920x1080.mkv", "keep me");

        FakeProcessRunner runner{ FakeMediaTools{} };
        MediaProber prober{ runner, "ffprobe" };

        EXPECT_THROW(rename_with_resolution(prober, file), TemplateError);
        EXPECT_TRUE(fs::exists(file));
    }

    TEST(Renamer, videoFilesByExtension)
    {
        ScopedTempDir dir;
        EXPECT_TRUE(is_video_file(dir.write("a.MKV")));
        EXPECT_TRUE(is_video_file(dir.write("b.divx")));
        EXPECT_FALSE(is_video_file(dir.write("notes.txt", "just some text\n")));
    }

    TEST(Renamer, batchRecordsFailures)
    {
        ScopedTempDir dir;
        dir.write("a.mkv");
        dir.write("sub/b.avi");
        dir.write("broken.mp4");
        dir.write("readme.txt", "not a video\n");

        FakeMediaTools tools;
        tools.unprobeable = { "broken.mp4" };
        tools.media["b.avi"] = FakeMedia{ .width = 640, .height = 480 };
        FakeProcessRunner runner{ tools };
        MediaProber prober{ runner, "ffprobe" };

        const std::vector<RenameOutcome> outcomes{ rename_batch(prober, dir.path()) };
        ASSERT_EQ(outcomes.size(), 3u);

        EXPECT_TRUE(outcomes[0].renamed);
        EXPECT_EQ(outcomes[0].to, dir.path() / "a-1920x1080.mkv");
        EXPECT_FALSE(outcomes[1].renamed);
        EXPECT_EQ(outcomes[1].from, dir.path() / "broken.mp4");
        EXPECT_FALSE(outcomes[1].detail.empty());
        EXPECT_TRUE(outcomes[2].renamed);
        EXPECT_EQ(outcomes[2].to, dir.path() / "sub" / "b-640x480.avi");
        EXPECT_TRUE(fs::exists(dir.path() / "readme.txt"));
    }

    TEST(Renamer, batchNeedsDirectory)
    {
        ScopedTempDir dir;
        FakeProcessRunner runner{ FakeMediaTools{} };
        MediaProber prober{ runner, "ffprobe" };

        EXPECT_THROW(rename_batch(prober, dir.path() / "missing"), SelectionError);
        EXPECT_THROW(rename_batch(prober, dir.write("file.mkv")), SelectionError);
    }
} // namespace vidtool::tests
