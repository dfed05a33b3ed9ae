#include <gtest/gtest.h>

#include "fake_process_runner.hpp"

#include "errors.hpp"
#include "media_descriptor.hpp"
#include "path_templater.hpp"

#include <cstdio>
#include <set>
#include <string>

namespace fs = std::filesystem;

namespace vidtool::tests
{
    namespace
    {
        MediaDescriptor descriptor()
        {
            return parse_probe_output(probe_json(FakeMedia{ .width = 1280, .height = 720, .vcodec = "hevc", .acodec = "opus", .duration = 95.7 }), "x");
        }

        template<typename F>
        void expectTemplateError(F&& f, TemplateError::Kind kind)
        {
            try
            {
                f();
                ADD_FAILURE() << "expected TemplateError";
            }
            catch (const TemplateError& e)
            {
                EXPECT_EQ(e.kind(), kind) << e.what();
            }
        }
    } // namespace

    TEST(PathTemplater, placeholders)
    {
        const MediaDescriptor d{ descriptor() };
        const fs::path source{ "/media/Show/episode.one.avi" };

        struct TestCase
        {
            std::string pattern;
            std::string expected;
        } testCases[]{
            { "{stem}", "episode.one" },
            { "{stem}{suffix}", "episode.one_x265" },
            { "{parent}-{stem}", "Show-episode.one" },
            { "{ext}", "avi" },
            { "{stem}-{resolution}", "episode.one-1280x720" },
            { "{width}_{height}", "1280_720" },
            { "{vcodec}.{acodec}", "hevc.opus" },
            { "{duration}s", "95s" },
            { "{{literal}} {stem}", "{literal} episode.one" },
            { "plain", "plain" },
        };

        for (const TestCase& testCase : testCases)
        {
            const NamingPattern pattern{ NamingPattern::parse(testCase.pattern) };
            EXPECT_EQ(pattern.expand(source, d, "_x265"), testCase.expected) << " pattern was '" << testCase.pattern << "'";
        }
    }

    TEST(PathTemplater, valuesAreSanitized)
    {
        const MediaDescriptor d{ descriptor() };
        const NamingPattern pattern{ NamingPattern::parse("{stem}{suffix}") };

        EXPECT_EQ(pattern.expand("/media/a.mkv", d, "/../evil:*"), "a_.._evil__");
    }

    TEST(PathTemplater, invalidPatterns)
    {
        struct TestCase
        {
            std::string pattern;
            TemplateError::Kind kind;
        } testCases[]{
            { "{title}", TemplateError::Kind::UnknownPlaceholder },
            { "{Stem}", TemplateError::Kind::UnknownPlaceholder },
            { "{stem", TemplateError::Kind::MalformedPattern },
            { "stem}", TemplateError::Kind::MalformedPattern },
            { "{st{em}", TemplateError::Kind::MalformedPattern },
            { "", TemplateError::Kind::MalformedPattern },
        };

        for (const TestCase& testCase : testCases)
        {
            expectTemplateError([&] { NamingPattern::parse(testCase.pattern); }, testCase.kind);
        }
    }

    TEST(PathTemplater, resolveDefaults)
    {
        ScopedTempDir dir;
        const fs::path source{ dir.write("movie.avi") };

        OutputOptions options;
        options.extension = "mkv";
        options.suffix = "_h265";

        const PathResolution r{ resolve_output_path(source, descriptor(), options) };
        EXPECT_EQ(r.path, dir.path() / "movie_h265.mkv");
        EXPECT_FALSE(r.exists);
        EXPECT_FALSE(r.needs_decision);

        // empty extension keeps the source's
        options.extension.clear();
        EXPECT_EQ(resolve_output_path(source, descriptor(), options).path, dir.path() / "movie_h265.avi");
    }

    TEST(PathTemplater, outputDirectoryAndSubdirectories)
    {
        ScopedTempDir dir;
        const fs::path source{ dir.write("in/movie.avi") };

        OutputOptions options;
        options.pattern = "{resolution}/{stem}";
        options.extension = ".mp4";
        options.output_directory = dir.path() / "out";

        EXPECT_EQ(resolve_output_path(source, descriptor(), options).path, dir.path() / "out" / "1280x720" / "movie.mp4");
    }

    TEST(PathTemplater, escapingPatternsAreRejected)
    {
        ScopedTempDir dir;
        const fs::path source{ dir.write("movie.avi") };

        OutputOptions options;
        options.pattern = "../{stem}";
        expectTemplateError([&] { resolve_output_path(source, descriptor(), options); }, TemplateError::Kind::MalformedPattern);

        options.pattern = "/abs/{stem}";
        expectTemplateError([&] { resolve_output_path(source, descriptor(), options); }, TemplateError::Kind::MalformedPattern);
    }

    TEST(PathTemplater, sameAsInput)
    {
        ScopedTempDir dir;
        const fs::path source{ dir.write("movie.mkv") };

        OutputOptions options;
        options.pattern = "{stem}";
        options.collision = CollisionPolicy::Force;
        expectTemplateError([&] { resolve_output_path(source, descriptor(), options); }, TemplateError::Kind::SameAsInput);
    }

    TEST(PathTemplater, collisionPolicies)
    {
        ScopedTempDir dir;
        const fs::path source{ dir.write("movie.avi") };
        const fs::path existing{ dir.write("movie.mkv") };

        OutputOptions options;
        options.pattern = "{stem}";
        options.extension = "mkv";

        options.collision = CollisionPolicy::Force;
        PathResolution r{ resolve_output_path(source, descriptor(), options) };
        EXPECT_EQ(r.path, existing);
        EXPECT_TRUE(r.exists);
        EXPECT_FALSE(r.needs_decision);

        options.collision = CollisionPolicy::Prompt;
        r = resolve_output_path(source, descriptor(), options);
        EXPECT_EQ(r.path, existing);
        EXPECT_TRUE(r.needs_decision);

        options.collision = CollisionPolicy::NoClobber;
        expectTemplateError([&] { resolve_output_path(source, descriptor(), options); }, TemplateError::Kind::CollisionDenied);

        options.collision = CollisionPolicy::Increment;
        r = resolve_output_path(source, descriptor(), options);
        EXPECT_EQ(r.path, dir.path() / "movie_001.mkv");
        EXPECT_FALSE(r.exists);

        dir.write("movie_001.mkv");
        dir.write("movie_002.mkv");
        EXPECT_EQ(resolve_output_path(source, descriptor(), options).path, dir.path() / "movie_003.mkv");
    }

    TEST(PathTemplater, incrementRunsOut)
    {
        ScopedTempDir dir;
        const fs::path target{ dir.write("full.mkv") };
        for (int n = 1; n <= 999; ++n)
        {
            char name[32];
            std::snprintf(name, sizeof(name), "full_%03d.mkv", n);
            dir.write(name);
        }

        expectTemplateError([&] { apply_collision_policy(target, CollisionPolicy::Increment); }, TemplateError::Kind::NoFreeName);
    }

    TEST(PathTemplater, incrementStepsOverNamesTakenElsewhere)
    {
        ScopedTempDir dir;
        const fs::path target{ dir.path() / "clip.mkv" };
        const std::set<fs::path> taken{ target, dir.path() / "clip_001.mkv" };
        const PathTaken isTaken{ [&taken](const fs::path& p) { return taken.contains(p); } };

        EXPECT_EQ(apply_collision_policy(target, CollisionPolicy::Increment, isTaken).path, dir.path() / "clip_002.mkv");

        // names on disk and names taken elsewhere add up
        dir.write("clip_002.mkv");
        EXPECT_EQ(apply_collision_policy(target, CollisionPolicy::Increment, isTaken).path, dir.path() / "clip_003.mkv");

        // the other policies only look at the disk
        const PathResolution forced{ apply_collision_policy(target, CollisionPolicy::Force, isTaken) };
        EXPECT_EQ(forced.path, target);
        EXPECT_FALSE(forced.exists);
        EXPECT_NO_THROW(apply_collision_policy(target, CollisionPolicy::NoClobber, isTaken));
    }

    TEST(PathTemplater, normalizeExtension)
    {
        EXPECT_EQ(normalize_extension("mkv"), ".mkv");
        EXPECT_EQ(normalize_extension(".mp4"), ".mp4");
        EXPECT_EQ(normalize_extension(""), "");
    }
} // namespace vidtool::tests
