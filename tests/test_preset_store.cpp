#include <gtest/gtest.h>

#include "fake_process_runner.hpp"

#include "errors.hpp"
#include "preset_store.hpp"

#include <fstream>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace vidtool::tests
{
    namespace
    {
        template<typename F>
        void expectPresetError(F&& f, PresetError::Kind kind)
        {
            try
            {
                f();
                ADD_FAILURE() << "expected PresetError";
            }
            catch (const PresetError& e)
            {
                EXPECT_EQ(e.kind(), kind) << e.what();
            }
        }

        Preset sample(const std::string& name)
        {
            return Preset{ name, "desc of " + name, TranscodeOptions{ .x265 = true, .crf = 20, .fix_errors = true, .custom_flags = { "-preset", "slow" } }, ".mkv", "_x" };
        }
    } // namespace

    TEST(PresetStore, emptyWithoutFile)
    {
        ScopedTempDir dir;
        const PresetStore store{ dir.path() / "presets.json" };

        EXPECT_TRUE(store.list().empty());
        EXPECT_FALSE(fs::exists(dir.path() / "presets.json"));
    }

    TEST(PresetStore, seedsDefaults)
    {
        ScopedTempDir dir;
        const fs::path file{ dir.path() / "conf" / "presets.json" };
        const PresetStore store{ file, true };

        EXPECT_TRUE(fs::exists(file));
        EXPECT_EQ(store.list().size(), PresetStore::default_presets().size());
        ASSERT_TRUE(store.contains("H.265 Balanced"));

        const Preset balanced{ store.get("H.265 Balanced") };
        EXPECT_EQ(balanced.options.video_codec, std::optional<std::string>{ "libx265" });
        EXPECT_EQ(balanced.options.crf, std::optional<int>{ 23 });
        EXPECT_EQ(balanced.output_suffix, "_h265");

        for (const Preset& p : PresetStore::default_presets())
            EXPECT_NO_THROW(p.options.validate()) << p.name;
    }

    TEST(PresetStore, saveAndReload)
    {
        ScopedTempDir dir;
        const fs::path file{ dir.path() / "presets.json" };
        {
            PresetStore store{ file };
            store.save(sample("Web.Small"));
            store.save("Plain", TranscodeOptions{ .video_codec = "libx264", .audio_codec = "aac" });
        }

        const PresetStore reloaded{ file };
        const std::set<std::string> expected{ "Plain", "Web.Small" };
        EXPECT_EQ(reloaded.list(), expected);
        EXPECT_EQ(reloaded.get("Web.Small"), sample("Web.Small"));
        EXPECT_EQ(reloaded.load("Plain"), (TranscodeOptions{ .video_codec = "libx264", .audio_codec = "aac" }));
    }

    TEST(PresetStore, saveOptionsKeepsMetadata)
    {
        ScopedTempDir dir;
        PresetStore store{ dir.path() / "presets.json" };
        store.save(sample("Mine"));
        store.save("Mine", TranscodeOptions{ .audio_codec = "libopus" });

        const Preset p{ store.get("Mine") };
        EXPECT_EQ(p.description, "desc of Mine");
        EXPECT_EQ(p.output_extension, ".mkv");
        EXPECT_EQ(p.options, (TranscodeOptions{ .audio_codec = "libopus" }));
    }

    TEST(PresetStore, rejectsInvalid)
    {
        ScopedTempDir dir;
        PresetStore store{ dir.path() / "presets.json" };

        expectPresetError([&] { store.save("  ", TranscodeOptions{}); }, PresetError::Kind::InvalidName);
        EXPECT_THROW(store.save("Bad", TranscodeOptions{ .strip_video = true, .x265 = true }), OptionConflict);
        expectPresetError([&] { store.get("Missing"); }, PresetError::Kind::NotFound);
        EXPECT_TRUE(store.list().empty());
    }

    TEST(PresetStore, renameAndRemove)
    {
        ScopedTempDir dir;
        const fs::path file{ dir.path() / "presets.json" };
        PresetStore store{ file };
        store.save(sample("A"));
        store.save(sample("B"));

        expectPresetError([&] { store.rename("A", "B"); }, PresetError::Kind::AlreadyExists);
        expectPresetError([&] { store.rename("Nope", "C"); }, PresetError::Kind::NotFound);
        expectPresetError([&] { store.rename("A", ""); }, PresetError::Kind::InvalidName);

        store.rename("A", "C");
        EXPECT_FALSE(store.contains("A"));
        EXPECT_EQ(store.get("C").description, "desc of A");
        EXPECT_EQ(store.get("C").name, "C");

        store.remove("B");
        store.remove("B"); // unknown names are ignored

        const PresetStore reloaded{ file };
        const std::set<std::string> expected{ "C" };
        EXPECT_EQ(reloaded.list(), expected);
    }

    TEST(PresetStore, failedWriteKeepsPreviousState)
    {
        ScopedTempDir dir;
        PresetStore store{ dir.path() / "store" / "presets.json" };
        store.save(sample("A"));
        store.save(sample("B"));
        const fs::path shared{ dir.path() / "shared.json" };
        store.export_to(shared, { "A" });

        // the store directory becomes a plain file: every later write fails
        fs::remove_all(dir.path() / "store");
        dir.write("store", "not a directory");

        expectPresetError([&] { store.save(sample("C")); }, PresetError::Kind::WriteFailed);
        expectPresetError([&] { store.save("A", TranscodeOptions{ .fix_errors = true }); }, PresetError::Kind::WriteFailed);
        expectPresetError([&] { store.remove("A"); }, PresetError::Kind::WriteFailed);
        expectPresetError([&] { store.rename("A", "Z"); }, PresetError::Kind::WriteFailed);
        expectPresetError([&] { store.import_from(shared); }, PresetError::Kind::WriteFailed);

        const std::set<std::string> expected{ "A", "B" };
        EXPECT_EQ(store.list(), expected);
        EXPECT_EQ(store.get("A"), sample("A"));
    }

    TEST(PresetStore, exportAndImportRenamesClashes)
    {
        ScopedTempDir dir;
        PresetStore source{ dir.path() / "a.json" };
        source.save(sample("Shared"));
        source.save(sample("Other"));
        source.export_to(dir.path() / "export.json", { "Shared" });

        PresetStore target{ dir.path() / "b.json" };
        target.save(sample("Shared"));

        const std::vector<std::string> first{ target.import_from(dir.path() / "export.json") };
        const std::vector<std::string> second{ target.import_from(dir.path() / "export.json") };

        EXPECT_EQ(first, std::vector<std::string>{ "Shared (1)" });
        EXPECT_EQ(second, std::vector<std::string>{ "Shared (2)" });
        EXPECT_FALSE(target.contains("Other"));
        EXPECT_EQ(target.get("Shared (2)").options, sample("Shared").options);

        expectPresetError([&] { source.export_to(dir.path() / "x.json", { "Missing" }); }, PresetError::Kind::NotFound);
    }

    TEST(PresetStore, importSkipsInvalidPresets)
    {
        ScopedTempDir dir;
        const fs::path file{ dir.write("import.json", R"({
            "version": "1.0",
            "presets": {
                "Good": { "video_codec": "libx264", "crf": "22" },
                "Bad": { "strip_video": "true", "x265": "true" }
            }
        })") };

        PresetStore store{ dir.path() / "presets.json" };
        const std::vector<std::string> imported{ store.import_from(file) };

        EXPECT_EQ(imported, std::vector<std::string>{ "Good" });
        EXPECT_EQ(store.get("Good").options.crf, std::optional<int>{ 22 });
    }

    TEST(PresetStore, unreadableFiles)
    {
        ScopedTempDir dir;
        const fs::path garbage{ dir.write("garbage.json", "{ not json") };
        const fs::path noSection{ dir.write("empty.json", R"({"version": "1.0"})") };

        expectPresetError([&] { PresetStore store{ garbage }; }, PresetError::Kind::Unreadable);
        expectPresetError([&] { PresetStore store{ noSection }; }, PresetError::Kind::Unreadable);

        PresetStore store{ dir.path() / "presets.json" };
        expectPresetError([&] { store.import_from(dir.path() / "missing.json"); }, PresetError::Kind::Unreadable);
    }
} // namespace vidtool::tests
