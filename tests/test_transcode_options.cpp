#include <gtest/gtest.h>

#include "errors.hpp"
#include "transcode_options.hpp"

#include <string>
#include <vector>

namespace vidtool::tests
{
    TEST(TranscodeOptions, validCombinations)
    {
        struct TestCase
        {
            const char* name;
            TranscodeOptions options;
        } testCases[]{
            { "empty", TranscodeOptions{} },
            { "codecs", TranscodeOptions{ .video_codec = "libx264", .audio_codec = "aac" } },
            { "x265 with its own codec name", TranscodeOptions{ .video_codec = "libx265", .x265 = true } },
            { "strip audio keeps video codec", TranscodeOptions{ .video_codec = "libvpx-vp9", .strip_audio = true } },
            { "av copy", TranscodeOptions{ .av_copy_only = true } },
            { "crf with x265", TranscodeOptions{ .x265 = true, .crf = 0 } },
            { "crf max", TranscodeOptions{ .video_codec = "libx264", .crf = 63 } },
            { "fix resolution while encoding", TranscodeOptions{ .x265 = true, .fix_resolution = true } },
            { "fix resolution with default encoder", TranscodeOptions{ .fix_resolution = true } },
            { "three kinds stripped", TranscodeOptions{ .strip_video = true, .strip_audio = true, .strip_subtitles = true } },
        };

        for (const TestCase& testCase : testCases)
        {
            EXPECT_NO_THROW(testCase.options.validate()) << testCase.name;
        }
    }

    TEST(TranscodeOptions, conflicts)
    {
        struct TestCase
        {
            const char* name;
            TranscodeOptions options;
        } testCases[]{
            { "blank video codec", TranscodeOptions{ .video_codec = "  " } },
            { "blank audio codec", TranscodeOptions{ .audio_codec = "" } },
            { "strip video with codec", TranscodeOptions{ .video_codec = "libx264", .strip_video = true } },
            { "strip audio with codec", TranscodeOptions{ .audio_codec = "aac", .strip_audio = true } },
            { "x265 with other codec", TranscodeOptions{ .video_codec = "libx264", .x265 = true } },
            { "x265 with strip video", TranscodeOptions{ .strip_video = true, .x265 = true } },
            { "av copy with strip", TranscodeOptions{ .strip_audio = true, .av_copy_only = true } },
            { "av copy with codec", TranscodeOptions{ .audio_codec = "aac", .av_copy_only = true } },
            { "av copy with x265", TranscodeOptions{ .av_copy_only = true, .x265 = true } },
            { "crf too high", TranscodeOptions{ .x265 = true, .crf = 64 } },
            { "crf negative", TranscodeOptions{ .x265 = true, .crf = -1 } },
            { "crf without encoder", TranscodeOptions{ .crf = 20 } },
            { "crf with copy", TranscodeOptions{ .video_codec = "copy", .crf = 20 } },
            { "fix resolution with copy", TranscodeOptions{ .video_codec = "copy", .fix_resolution = true } },
            { "fix resolution with av copy", TranscodeOptions{ .av_copy_only = true, .fix_resolution = true } },
            { "everything stripped", TranscodeOptions{ .strip_video = true, .strip_audio = true, .strip_subtitles = true, .strip_data = true } },
        };

        for (const TestCase& testCase : testCases)
        {
            EXPECT_THROW(testCase.options.validate(), OptionConflict) << testCase.name;
        }
    }

    TEST(TranscodeOptions, effectiveEncoder)
    {
        EXPECT_FALSE(TranscodeOptions{}.encodes_video());
        EXPECT_FALSE((TranscodeOptions{ .video_codec = "copy" }.encodes_video()));

        const TranscodeOptions x265{ .x265 = true };
        EXPECT_TRUE(x265.encodes_video());
        EXPECT_EQ(x265.effective_video_encoder(), std::optional<std::string>{ "libx265" });
        EXPECT_EQ(x265.effective_crf(), std::optional<int>{ X265_DEFAULT_CRF });

        const TranscodeOptions x264{ .video_codec = "libx264" };
        EXPECT_EQ(x264.effective_video_encoder(), std::optional<std::string>{ "libx264" });
        EXPECT_FALSE(x264.effective_crf().has_value());

        const TranscodeOptions tuned{ .x265 = true, .crf = 18 };
        EXPECT_EQ(tuned.effective_crf(), std::optional<int>{ 18 });
    }

    TEST(TranscodeOptions, splitCustomFlags)
    {
        struct TestCase
        {
            std::string text;
            std::vector<std::string> expected;
        } testCases[]{
            { "", {} },
            { "   ", {} },
            { "-preset slow", { "-preset", "slow" } },
            { "  -tune   film ", { "-tune", "film" } },
            { "-metadata title='My Movie'", { "-metadata", "title=My Movie" } },
            { R"(-vf "scale=1280:-2, fps=30")", { "-vf", "scale=1280:-2, fps=30" } },
            { "-x ''", { "-x", "" } },
        };

        for (const TestCase& testCase : testCases)
        {
            EXPECT_EQ(split_custom_flags(testCase.text), testCase.expected) << " text was '" << testCase.text << "'";
        }

        EXPECT_THROW(split_custom_flags("-metadata 'title=oops"), OptionConflict);
    }
} // namespace vidtool::tests
