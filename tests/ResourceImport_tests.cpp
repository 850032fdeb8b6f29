// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include "ResourceImportService.hpp"
#include "EngineContext.hpp"
#include "MainThreadQueue.hpp"
#include "AssetRegistry.hpp"
#include "LogManager.hpp"
#include "SpriteAssetSerialization.hpp"
#include "SpriteSheetImporter.hpp"
#include "mock/MockCollaborators.hpp"
#include <algorithm>
#include <chrono>
#include <set>
#include <thread>

using namespace aforge;
namespace fs = std::filesystem;

namespace
{
    bool any_line_contains(const LogManager& log, const std::string& text)
    {
        const auto lines = log.lines();
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& l) { return l.find(text) != std::string::npos; });
    }
}

class ResourceImportTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        settings.file_path = tmp / "atlasforge.json";
        settings.pack = PackOptions{ 256, 1, false };
        ctx = make_context();
    }

    std::unique_ptr<EngineContext> make_context()
    {
        log = std::make_shared<LogManager>();
        log->set_echo(false);
        uploader = std::make_shared<mock::MockTextureUploader>();
        tool = std::make_shared<mock::MockExternalTool>(ToolResult{});
        return std::make_unique<EngineContext>(log, std::make_shared<StbImageDecoder>(), uploader, tool, 2);
    }

    // Pump the main thread queue like an editor frame loop until the pass resolves
    TaskResult import(ResourceImportService& service, bool force_all)
    {
        auto fut = service.import_resources_async(force_all);
        while (fut.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready)
        {
            ctx->main_thread_queue->wait_for_work(std::chrono::milliseconds(5));
            ctx->main_thread_queue->execute_all();
        }
        return fut.get();
    }

    fs::path res_root() const { return tmp / "resources"; }
    fs::path packed() const { return tmp / "packed"; }
    fs::path bin() const { return tmp / "bin/resources"; }

    void write_sprite(const std::string& rel, int w, int h, uint8_t shade)
    {
        mock::write_png(res_root() / rel, mock::make_image(w, h, shade, shade, shade));
    }

    mock::TempDirectory tmp;
    EditorSettings settings;
    std::shared_ptr<LogManager> log;
    std::shared_ptr<mock::MockTextureUploader> uploader;
    std::shared_ptr<mock::MockExternalTool> tool;
    std::unique_ptr<EngineContext> ctx;
};

TEST_F(ResourceImportTest, FullPackPublishesAtlasesAndSprites)
{
    write_sprite("images/hero.png", 32, 32, 40);
    write_sprite("images/enemy.png", 16, 16, 80);
    write_sprite("editor/icon.png", 8, 8, 120);
    mock::write_file(res_root() / "readme.txt", "not an image");

    ResourceImportService service(*ctx, settings);
    const auto res = import(service, true);
    EXPECT_TRUE(res.success);

    auto gameplay = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(gameplay, nullptr);
    EXPECT_TRUE(gameplay->has_entry("images/hero"));
    EXPECT_TRUE(gameplay->has_entry("images/enemy"));
    EXPECT_FALSE(gameplay->has_entry("editor/icon"));

    auto editor = ctx->asset_registry->get_atlas(AtlasId::Editor);
    ASSERT_NE(editor, nullptr);
    EXPECT_TRUE(editor->has_entry("editor/icon"));

    EXPECT_EQ(ctx->asset_registry->sprites(AtlasId::Gameplay).size(), 2u);
    EXPECT_GE(uploader->live(), 2u);

    for (const auto& root : { packed(), bin() })
    {
        EXPECT_TRUE(fs::exists(root / "atlas/gameplay.json"));
        EXPECT_TRUE(fs::exists(root / "atlas/gameplay_0.png"));
        EXPECT_TRUE(fs::exists(root / "atlas/editor.json"));
        EXPECT_TRUE(fs::exists(root / serializers::sprite_asset_path("gameplay", "images/hero")));
    }

    EXPECT_TRUE(any_line_contains(*log, "Pack 'gameplay' (2 images,"));
    EXPECT_GT(service.settings().last_imported, EditorSettings::Clock::time_point{});
    EXPECT_TRUE(fs::exists(settings.file_path));
}

TEST_F(ResourceImportTest, PassPublishesThroughMainThreadQueue)
{
    write_sprite("images/a.png", 16, 16, 10);
    ResourceImportService service(*ctx, settings);

    auto fut = service.import_resources_async(true);

    // The pass parks its flush on the queue and waits for the main thread
    ASSERT_TRUE(ctx->main_thread_queue->wait_for_work(std::chrono::seconds(10)));
    EXPECT_EQ(fut.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);
    EXPECT_EQ(ctx->asset_registry->get_atlas(AtlasId::Gameplay), nullptr);

    EXPECT_EQ(ctx->main_thread_queue->execute_all(), 1u);
    const auto res = fut.get();
    EXPECT_TRUE(res.success);
    ASSERT_NE(ctx->asset_registry->get_atlas(AtlasId::Gameplay), nullptr);
    EXPECT_EQ(uploader->upload_threads(), std::set<std::thread::id>{ std::this_thread::get_id() });

    // Nothing left to publish
    EXPECT_TRUE(service.after_content_loaded().results.empty());
}

TEST_F(ResourceImportTest, PackLogReportsLargestPage)
{
    settings.pack = PackOptions{ 64, 0, false };
    write_sprite("images/big.png", 64, 64, 10);
    write_sprite("images/small.png", 32, 32, 20);

    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(import(service, true).success);

    auto atlas = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(atlas, nullptr);
    ASSERT_EQ(atlas->page_count(), 2);
    EXPECT_TRUE(any_line_contains(*log, "Pack 'gameplay' (2 images, 2 pages, up to 64x64)"));
}

TEST_F(ResourceImportTest, RepeatedFullPackIsByteIdentical)
{
    write_sprite("images/a.png", 30, 20, 10);
    write_sprite("images/b.png", 12, 40, 90);
    write_sprite("images/c.png", 24, 24, 170);

    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(import(service, true).success);
    const auto json1 = mock::read_file(packed() / "atlas/gameplay.json");
    const auto png1 = mock::read_file(packed() / "atlas/gameplay_0.png");
    const auto sprite1 = mock::read_file(packed() / serializers::sprite_asset_path("gameplay", "images/b"));

    ASSERT_TRUE(import(service, true).success);
    EXPECT_EQ(mock::read_file(packed() / "atlas/gameplay.json"), json1);
    EXPECT_EQ(mock::read_file(packed() / "atlas/gameplay_0.png"), png1);
    EXPECT_EQ(mock::read_file(packed() / serializers::sprite_asset_path("gameplay", "images/b")), sprite1);
    EXPECT_EQ(ctx->asset_registry->sprite_count(), 3u);
}

TEST_F(ResourceImportTest, NoMatchingFilesIsNotAnError)
{
    mock::write_file(res_root() / "notes/todo.txt", "nothing to pack");

    ResourceImportService service(*ctx, settings);
    const auto res = import(service, true);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(ctx->asset_registry->get_atlas(AtlasId::Gameplay), nullptr);
    EXPECT_FALSE(fs::exists(packed() / "atlas/gameplay.json"));
    EXPECT_EQ(log->count("[ERROR]"), 0u);
}

TEST_F(ResourceImportTest, MissingResourceRootFails)
{
    ResourceImportService service(*ctx, settings);
    const auto res = import(service, true);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(log->count("[WARN]"), 1u);
    EXPECT_EQ(service.settings().last_imported, EditorSettings::Clock::time_point{});
}

TEST_F(ResourceImportTest, UndecodableFileIsSkipped)
{
    write_sprite("images/good.png", 16, 16, 50);
    mock::write_file(res_root() / "images/broken.png", "definitely not a png");

    ResourceImportService service(*ctx, settings);
    const auto res = import(service, true);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.failure_count(), 1u);

    auto gameplay = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(gameplay, nullptr);
    EXPECT_TRUE(gameplay->has_entry("images/good"));
    EXPECT_FALSE(gameplay->has_entry("images/broken"));
}

TEST_F(ResourceImportTest, SpriteSheetFramesArePacked)
{
    write_sprite("images/walk.png", 32, 16, 60);
    mock::write_file(res_root() / "images/walk.sprite.json",
        R"({ "frame_width": 16, "frame_height": 16, "animations": { "walk": { "frames": [0, 1], "durations_ms": [100, 100] } } })");

    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(import(service, true).success);

    auto gameplay = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(gameplay, nullptr);
    EXPECT_TRUE(gameplay->has_entry("images/walk_0000"));
    EXPECT_TRUE(gameplay->has_entry("images/walk_0001"));

    auto sprite = ctx->asset_registry->get(assets::sprite_guid("gameplay", "images/walk"));
    EXPECT_EQ(sprite->frames.size(), 2u);
    EXPECT_EQ(sprite->animations.at("walk").total_ms(), 200);
}

TEST_F(ResourceImportTest, ReloadKeepsUntouchedEntries)
{
    write_sprite("images/a.png", 32, 32, 10);
    write_sprite("images/b.png", 32, 32, 20);
    write_sprite("images/c.png", 32, 32, 30);

    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(import(service, true).success);

    auto before = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    const auto b_before = before->get("images/b");
    const auto c_before = before->get("images/c");

    write_sprite("images/a.png", 32, 32, 222);
    mock::touch_future(res_root() / "images/a.png");

    const auto res = service.reload_on_window_foreground();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.type, TaskResult::TaskType::Reload);

    auto after = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(after, before);
    EXPECT_EQ(after->get("images/b"), b_before);
    EXPECT_EQ(after->get("images/c"), c_before);
    EXPECT_EQ(after->entry_count(), 3u);

    const Image a = after->extract("images/a");
    EXPECT_EQ(a.at(0, 0)[0], 222);

    // The old snapshot is still whole
    EXPECT_EQ(before->extract("images/a").at(0, 0)[0], 10);

    // Saved with the target name, temporary artifacts gone
    EXPECT_TRUE(fs::exists(bin() / "atlas/gameplay.json"));
    EXPECT_FALSE(fs::exists(bin() / "atlas/temporary.json"));
    EXPECT_FALSE(fs::exists(packed() / "atlas/temporary_0.png"));
}

TEST_F(ResourceImportTest, ReloadWithFailedSpriteWriteKeepsOldSprite)
{
    write_sprite("images/a.png", 32, 32, 10);
    write_sprite("images/b.png", 32, 32, 20);

    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(import(service, true).success);

    const Guid b_guid = Guid::from_name("gameplay:images/b");
    auto before = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    const auto b_rect = before->get("images/b");

    // A directory where the sprite JSON goes makes its source write fail
    const fs::path sprite_file = packed() / serializers::sprite_asset_path("gameplay", "images/b");
    fs::remove(sprite_file);
    fs::create_directories(sprite_file);

    write_sprite("images/b.png", 32, 32, 200);
    mock::touch_future(res_root() / "images/b.png");

    const auto res = service.reload_on_window_foreground();
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.failure_count(), 1u);

    // Old sprite and its frames are still live
    ASSERT_TRUE(ctx->asset_registry->contains(b_guid));
    auto after = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(after, nullptr);
    ASSERT_TRUE(after->has_entry("images/b"));
    EXPECT_EQ(after->get("images/b"), b_rect);
    EXPECT_EQ(after->extract("images/b").at(0, 0)[0], 20);
    EXPECT_TRUE(after->has_entry("images/a"));
}

TEST_F(ResourceImportTest, FullPackResetsReloadedKeys)
{
    write_sprite("images/a.png", 16, 16, 10);
    write_sprite("images/b.png", 16, 16, 20);

    ResourceImportService service(*ctx, settings);
    const assets::GameplaySpriteImporter* gameplay = nullptr;
    for (const auto& importer : service.importers().importers())
        if (auto* p = dynamic_cast<const assets::GameplaySpriteImporter*>(importer.get()))
            gameplay = p;
    ASSERT_NE(gameplay, nullptr);

    ASSERT_TRUE(import(service, true).success);
    EXPECT_TRUE(gameplay->reload_controller().reloaded_keys().empty());

    mock::touch_future(res_root() / "images/a.png", std::chrono::seconds(60));
    ASSERT_TRUE(service.reload_on_window_foreground().success);
    EXPECT_EQ(gameplay->reload_controller().reloaded_keys(), std::set<std::string>{ "images/a" });
    EXPECT_TRUE(any_line_contains(*log, "1 keys reloaded since the last full pack"));

    ASSERT_TRUE(import(service, true).success);
    EXPECT_TRUE(gameplay->reload_controller().reloaded_keys().empty());
}

TEST_F(ResourceImportTest, ReloadWithNothingChangedDoesNothing)
{
    write_sprite("images/a.png", 16, 16, 10);
    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(import(service, true).success);

    auto before = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    const auto res = service.reload_on_window_foreground();
    EXPECT_TRUE(res.success);
    EXPECT_TRUE(res.results.empty());
    EXPECT_EQ(ctx->asset_registry->get_atlas(AtlasId::Gameplay), before);
}

TEST_F(ResourceImportTest, ReloadStartsFromSavedAtlas)
{
    write_sprite("images/a.png", 16, 16, 10);
    write_sprite("images/b.png", 16, 16, 20);
    {
        ResourceImportService service(*ctx, settings);
        ASSERT_TRUE(import(service, true).success);
        settings = service.settings();
    }

    // New session: nothing published yet
    ctx = make_context();
    write_sprite("images/b.png", 16, 16, 99);
    mock::touch_future(res_root() / "images/b.png");

    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(service.reload_on_window_foreground().success);

    auto atlas = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(atlas, nullptr);
    EXPECT_TRUE(atlas->has_entry("images/a"));
    EXPECT_EQ(atlas->extract("images/a").at(0, 0)[0], 10);
    EXPECT_EQ(atlas->extract("images/b").at(0, 0)[0], 99);
}

TEST_F(ResourceImportTest, UnchangedPassReusesSavedAtlas)
{
    write_sprite("images/a.png", 16, 16, 10);
    write_sprite("images/b.png", 24, 24, 20);
    {
        ResourceImportService service(*ctx, settings);
        ASSERT_TRUE(import(service, true).success);
        settings = service.settings();
    }
    const auto json_before = mock::read_file(bin() / "atlas/gameplay.json");

    ctx = make_context();
    ResourceImportService service(*ctx, settings);
    const auto res = import(service, false);
    EXPECT_TRUE(res.success);
    EXPECT_TRUE(any_line_contains(*log, "reusing saved atlas 'gameplay'"));

    auto atlas = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(atlas, nullptr);
    EXPECT_EQ(atlas->entry_count(), 2u);
    EXPECT_EQ(ctx->asset_registry->sprites(AtlasId::Gameplay).size(), 2u);
    EXPECT_EQ(mock::read_file(bin() / "atlas/gameplay.json"), json_before);
}

TEST_F(ResourceImportTest, ReloadIsMainThreadOnly)
{
    ResourceImportService service(*ctx, settings);
    bool threw = false;
    std::thread worker([&]
        {
            try
            {
                service.reload_on_window_foreground();
            }
            catch (const std::logic_error&)
            {
                threw = true;
            }
        });
    worker.join();
    EXPECT_TRUE(threw);
}

TEST_F(ResourceImportTest, FontsAreConverted)
{
    mock::write_file(res_root() / "fonts/title.ttf", "ttf");
    mock::write_file(res_root() / "fonts/body.ttf", "ttf");
    mock::write_file(res_root() / "fonts/fonts.json", R"({ "title.ttf": { "index": 0, "size": 32 } })");

    ResourceImportService service(*ctx, settings);
    const auto res = import(service, true);

    // body.ttf has no entry in fonts.json
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.failure_count(), 1u);
    EXPECT_TRUE(any_line_contains(*log, "Maybe there's a typo?"));

    const auto calls = tool->calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_EQ(calls[0].size(), 3u);
    EXPECT_EQ(fs::path(calls[0][0]).filename(), "title.ttf");
    EXPECT_EQ(calls[0][1], "32");
    EXPECT_EQ(fs::path(calls[0][2]), packed() / "fonts/title");
}

TEST_F(ResourceImportTest, FontToolFailureIsReported)
{
    tool = std::make_shared<mock::MockExternalTool>(ToolResult{ 3, "bad glyph table" });
    ctx->external_tool = tool;
    mock::write_file(res_root() / "fonts/title.ttf", "ttf");
    mock::write_file(res_root() / "fonts/fonts.json", R"({ "title.ttf": { "index": 0, "size": 32 } })");

    ResourceImportService service(*ctx, settings);
    const auto res = import(service, true);
    EXPECT_FALSE(res.success);
    EXPECT_TRUE(any_line_contains(*log, "bad glyph table"));
}

TEST_F(ResourceImportTest, ScanHiresImages)
{
    write_sprite("hires_images/splash.png", 4, 4, 1);
    write_sprite("hires_images/menu/Background.PNG", 4, 4, 1);
    mock::write_file(res_root() / "hires_images/credits.txt", "x");

    ResourceImportService service(*ctx, settings);
    EXPECT_EQ(service.scan_hires_images(), (std::vector<std::string>{ "menu/Background", "splash" }));

    // Only the hires_images folder itself is excluded from packing
    ASSERT_TRUE(import(service, true).success);
    auto gameplay = ctx->asset_registry->get_atlas(AtlasId::Gameplay);
    ASSERT_NE(gameplay, nullptr);
    EXPECT_FALSE(gameplay->has_entry("hires_images/splash"));
    EXPECT_TRUE(gameplay->has_entry("hires_images/menu/Background"));
}

TEST_F(ResourceImportTest, BuildBinContentFolder)
{
    write_sprite("images/a.png", 16, 16, 10);
    ResourceImportService service(*ctx, settings);
    ASSERT_TRUE(import(service, true).success);

    fs::remove_all(bin());
    EXPECT_GT(service.build_bin_content_folder(), 0u);
    EXPECT_EQ(mock::read_file(bin() / "atlas/gameplay.json"), mock::read_file(packed() / "atlas/gameplay.json"));
}
