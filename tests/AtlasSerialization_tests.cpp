// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "AtlasSerialization.hpp"
#include "SpriteAssetSerialization.hpp"
#include "AtlasAssembler.hpp"
#include "StbImageCodec.hpp"
#include "mock/MockCollaborators.hpp"

using namespace aforge;
namespace fs = std::filesystem;

namespace
{
    std::shared_ptr<TextureAtlas> make_atlas(AtlasId id, const std::vector<std::pair<std::string, int>>& squares, int max_size = 64, uint8_t first_shade = 20)
    {
        std::vector<SourceImage> images;
        uint8_t shade = first_shade;
        for (auto& [key, size] : squares)
        {
            images.push_back(SourceImage{ key, std::make_shared<Image>(mock::make_image(size, size, shade, 0, 0)) });
            shade += 40;
        }
        return AtlasAssembler(PackOptions{ max_size, 1, true }).assemble(id, to_string(id), std::move(images));
    }
}

TEST(AtlasSerializationTest, DescriptorRoundTrip)
{
    auto atlas = make_atlas(AtlasId::Gameplay, { {"images/hero", 30}, {"images/enemy", 20}, {"images/coin", 40} });
    const auto j = serializers::atlas_to_json(*atlas);

    EXPECT_EQ(j.at("id"), "gameplay");
    EXPECT_EQ(j.at("pages").size(), static_cast<size_t>(atlas->page_count()));

    auto back = serializers::atlas_from_json(j);
    EXPECT_EQ(back->id(), atlas->id());
    EXPECT_EQ(back->name(), atlas->name());
    ASSERT_EQ(back->page_count(), atlas->page_count());
    for (int i = 0; i < atlas->page_count(); i++)
    {
        EXPECT_EQ(back->page(i).path, atlas->page(i).path);
        EXPECT_EQ(back->page(i).width, atlas->page(i).width);
        EXPECT_EQ(back->page(i).height, atlas->page(i).height);
    }
    EXPECT_EQ(back->entries(), atlas->entries());
    EXPECT_EQ(serializers::atlas_to_json(*back), j);
}

TEST(AtlasSerializationTest, RejectsEntryOnMissingPage)
{
    nlohmann::json j = {
        {"id", "editor"}, {"name", "editor"},
        {"pages", nlohmann::json::array({ { {"path", "atlas/editor_0.png"}, {"width", 16}, {"height", 16} } })},
        {"entries", { {"icon", { {"page", 1}, {"x", 0}, {"y", 0}, {"w", 4}, {"h", 4}, {"rotated", false} }} }} };
    EXPECT_THROW(serializers::atlas_from_json(j), AtlasError);

    j["entries"]["icon"]["page"] = 0;
    EXPECT_NO_THROW(serializers::atlas_from_json(j));

    j["id"] = "bogus";
    EXPECT_THROW(serializers::atlas_from_json(j), AtlasError);
}

TEST(AtlasSerializationTest, SaveAndLoadAtlas)
{
    mock::TempDirectory tmp;
    DualPathSerializer s(tmp / "packed", tmp / "bin");
    auto atlas = make_atlas(AtlasId::Gameplay, { {"a", 40}, {"b", 40}, {"c", 40} });
    ASSERT_GT(atlas->page_count(), 1);

    EXPECT_EQ(serializers::serialize_atlas(*atlas, s, { false, false }), SaveStatus::Ok);
    for (auto& p : atlas->pages())
    {
        EXPECT_TRUE(fs::exists(tmp / "packed" / p.path));
        EXPECT_TRUE(fs::exists(tmp / "bin" / p.path));
    }
    EXPECT_TRUE(fs::exists(tmp / "bin/atlas/gameplay.json"));

    StbImageDecoder decoder;
    auto loaded = serializers::load_atlas(tmp / "bin", "gameplay", decoder);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->entries(), atlas->entries());
    for (auto& key : { "a", "b", "c" })
        EXPECT_EQ(loaded->extract(key).pixels, atlas->extract(key).pixels);

    EXPECT_EQ(serializers::load_atlas(tmp / "bin", "editor", decoder), nullptr);
}

TEST(AtlasSerializationTest, SavingTwiceIsByteIdentical)
{
    mock::TempDirectory tmp;
    DualPathSerializer s(tmp / "packed", tmp / "bin");
    auto atlas = make_atlas(AtlasId::Editor, { {"x", 12}, {"y", 9} });

    serializers::serialize_atlas(*atlas, s, { false, false });
    const auto png = mock::read_file(tmp / "packed/atlas/editor_0.png");
    const auto json = mock::read_file(tmp / "packed/atlas/editor.json");

    serializers::serialize_atlas(*atlas, s, { false, false });
    EXPECT_EQ(mock::read_file(tmp / "packed/atlas/editor_0.png"), png);
    EXPECT_EQ(mock::read_file(tmp / "packed/atlas/editor.json"), json);
    EXPECT_EQ(mock::read_file(tmp / "bin/atlas/editor.json"), json);
}

TEST(AtlasSerializationTest, StalePagesAndTemporaryArtifactsAreDeleted)
{
    mock::TempDirectory tmp;
    DualPathSerializer s(tmp / "packed", tmp / "bin");

    auto big = make_atlas(AtlasId::Gameplay, { {"a", 40}, {"b", 40}, {"c", 40} });
    serializers::serialize_atlas(*big, s, { false, false });
    ASSERT_TRUE(s.exists("atlas/gameplay_1.png"));

    s.save_text("atlas/temporary_0.png", "t");
    s.save_text("atlas/temporary.json", "{}");

    auto small = make_atlas(AtlasId::Gameplay, { {"a", 40} });
    ASSERT_EQ(small->page_count(), 1);
    serializers::serialize_atlas(*small, s, { false, true });

    EXPECT_TRUE(s.exists("atlas/gameplay_0.png"));
    EXPECT_FALSE(s.exists("atlas/gameplay_1.png"));
    EXPECT_FALSE(s.exists("atlas/temporary_0.png"));
    EXPECT_FALSE(s.exists("atlas/temporary.json"));
}

TEST(AtlasSerializationTest, FailedPageWriteLeavesBinaryTreeLoadable)
{
    mock::TempDirectory tmp;
    DualPathSerializer s(tmp / "packed", tmp / "bin");
    StbImageDecoder decoder;

    auto first = make_atlas(AtlasId::Gameplay, { {"a", 40}, {"b", 40}, {"c", 40} });
    ASSERT_EQ(first->page_count(), 3);
    ASSERT_EQ(serializers::serialize_atlas(*first, s, { false, false }), SaveStatus::Ok);
    const auto bin_page0 = mock::read_file(tmp / "bin/atlas/gameplay_0.png");
    const auto bin_descriptor = mock::read_file(tmp / "bin/atlas/gameplay.json");

    // A directory in the way of the second page's source copy
    fs::remove(tmp / "packed/atlas/gameplay_1.png");
    fs::create_directories(tmp / "packed/atlas/gameplay_1.png");

    auto second = make_atlas(AtlasId::Gameplay, { {"a", 40}, {"b", 40}, {"c", 40} }, 64, 200);
    EXPECT_EQ(serializers::serialize_atlas(*second, s, { false, false }), SaveStatus::SourceWriteFailed);

    // No binary copy was touched, so the binary atlas is still the first one
    EXPECT_EQ(mock::read_file(tmp / "bin/atlas/gameplay_0.png"), bin_page0);
    EXPECT_EQ(mock::read_file(tmp / "bin/atlas/gameplay.json"), bin_descriptor);

    auto loaded = serializers::load_atlas(tmp / "bin", "gameplay", decoder);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->extract("a").pixels, first->extract("a").pixels);
}

TEST(AtlasSerializationTest, EmptyAtlasIsNeverSaved)
{
    mock::TempDirectory tmp;
    DualPathSerializer s(tmp / "packed", tmp / "bin");
    TextureAtlas empty(AtlasId::Gameplay, "gameplay");
    EXPECT_THROW(serializers::serialize_atlas(empty, s), AtlasError);
    EXPECT_FALSE(s.exists("atlas/gameplay.json"));
}

TEST(AtlasSerializationTest, SpriteAssetRoundTrip)
{
    assets::SpriteAsset sprite;
    sprite.guid = assets::sprite_guid("gameplay", "images/hero");
    sprite.name = "images/hero";
    sprite.atlas = AtlasId::Gameplay;
    sprite.frames = { "images/hero_0000", "images/hero_0001" };
    sprite.animations["walk"] = assets::SpriteAnimation{ {0, 1}, {100, 120} };
    sprite.width = 16;
    sprite.height = 16;
    sprite.origin_x = 8;
    sprite.origin_y = 15;

    const auto j = serializers::sprite_asset_to_json(sprite);
    EXPECT_EQ(serializers::sprite_asset_from_json(j), sprite);
    EXPECT_EQ(serializers::sprite_asset_path("gameplay", sprite.name), "assets/generated/gameplay/images/hero.json");
}
