// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include "EditorSettings.hpp"
#include "mock/MockCollaborators.hpp"
#include <nlohmann/json.hpp>

using namespace aforge;

TEST(EditorSettingsTest, CreatesDefaultsWhenMissing)
{
    mock::TempDirectory dir;
    const auto path = dir / "config/atlasforge.json";

    const auto s = EditorSettings::load_or_create(path);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(s.pack.max_size, 2048);
    EXPECT_EQ(s.pack.padding, 1);
    EXPECT_TRUE(s.only_reload_atlas_with_changes);
    EXPECT_EQ(s.last_imported, EditorSettings::Clock::time_point{});
}

TEST(EditorSettingsTest, RelativePathsResolveAgainstTheFile)
{
    EditorSettings s;
    s.file_path = "/projects/game/atlasforge.json";
    EXPECT_EQ(s.resources_root(), std::filesystem::path("/projects/game/resources"));
    EXPECT_EQ(s.bin_root(), std::filesystem::path("/projects/game/bin/resources"));

    s.source_packed_path = "/elsewhere/packed";
    EXPECT_EQ(s.packed_root(), std::filesystem::path("/elsewhere/packed"));
}

TEST(EditorSettingsTest, SaveAndReload)
{
    mock::TempDirectory dir;
    EditorSettings s;
    s.file_path = dir / "atlasforge.json";
    s.pack = PackOptions{ 1024, 2, true };
    s.only_reload_atlas_with_changes = false;
    s.asset_name_pattern = "_{}";
    s.font_tool = "/opt/tools/fontbake";
    s.last_imported = EditorSettings::Clock::time_point(std::chrono::milliseconds(1700000000123));
    s.save();

    const auto loaded = EditorSettings::load_or_create(s.file_path);
    EXPECT_EQ(loaded.pack.max_size, 1024);
    EXPECT_EQ(loaded.pack.padding, 2);
    EXPECT_TRUE(loaded.pack.allow_rotation);
    EXPECT_FALSE(loaded.only_reload_atlas_with_changes);
    EXPECT_EQ(loaded.asset_name_pattern, "_{}");
    EXPECT_EQ(loaded.font_tool, "/opt/tools/fontbake");
    EXPECT_EQ(loaded.last_imported, s.last_imported);
}

TEST(EditorSettingsTest, RejectsInvalidValues)
{
    EditorSettings s;
    EXPECT_THROW(settings_from_json(nlohmann::json::parse(R"({ "max_page_size": 0 })"), s), std::runtime_error);
    EXPECT_THROW(settings_from_json(nlohmann::json::parse(R"({ "padding": -1 })"), s), std::runtime_error);
    EXPECT_THROW(settings_from_json(nlohmann::json::parse(R"({ "asset_name_pattern": "copy" })"), s), std::runtime_error);

    mock::TempDirectory dir;
    mock::write_file(dir / "bad.json", "{ broken");
    EXPECT_THROW(EditorSettings::load_or_create(dir / "bad.json"), nlohmann::json::exception);
}
