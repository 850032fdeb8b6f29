// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include "AssetRegistry.hpp"
#include <atomic>
#include <thread>

using namespace aforge;

namespace
{
    assets::SpriteAsset sprite(const std::string& name, AtlasId atlas = AtlasId::Gameplay)
    {
        assets::SpriteAsset s;
        s.guid = assets::sprite_guid(to_string(atlas), name);
        s.name = name;
        s.atlas = atlas;
        s.frames = { name };
        return s;
    }

    std::shared_ptr<TextureAtlas> atlas_with(const std::string& key)
    {
        auto a = std::make_shared<TextureAtlas>(AtlasId::Gameplay, "gameplay");
        a->add_page(AtlasPage{ "atlas/gameplay_0.png", 16, 16, nullptr, nullptr });
        a->add_entry(key, AtlasCoordinates{ 0, 0, 0, 4, 4, false });
        return a;
    }
}

TEST(AssetRegistryTest, AddGetRemove)
{
    AssetRegistry reg;
    auto s = sprite("images/hero");
    const Guid guid = s.guid;

    EXPECT_EQ(reg.try_get(guid), nullptr);
    EXPECT_THROW(reg.get(guid), std::out_of_range);

    reg.add(s);
    EXPECT_TRUE(reg.contains(guid));
    EXPECT_EQ(reg.get(guid)->name, "images/hero");
    EXPECT_THROW(reg.add(s), std::invalid_argument);

    EXPECT_TRUE(reg.remove(guid));
    EXPECT_FALSE(reg.remove(guid));
    EXPECT_EQ(reg.sprite_count(), 0u);
}

TEST(AssetRegistryTest, InvalidGuidRejected)
{
    AssetRegistry reg;
    assets::SpriteAsset s;
    s.name = "nameless";
    EXPECT_THROW(reg.add(s), std::invalid_argument);
}

TEST(AssetRegistryTest, SpriteGuidIsStable)
{
    EXPECT_EQ(assets::sprite_guid("gameplay", "images/hero"), assets::sprite_guid("gameplay", "images/hero"));
    EXPECT_NE(assets::sprite_guid("gameplay", "images/hero"), assets::sprite_guid("editor", "images/hero"));
    EXPECT_TRUE(assets::sprite_guid("gameplay", "").valid());
}

TEST(AssetRegistryTest, FindByNameIgnoresCase)
{
    AssetRegistry reg;
    reg.add(sprite("images/Hero"));
    auto found = reg.find_by_name("IMAGES/hero");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], assets::sprite_guid("gameplay", "images/Hero"));
    EXPECT_TRUE(reg.find_by_name("nobody").empty());
}

TEST(AssetRegistryTest, NextAvailableName)
{
    AssetRegistry reg;
    EXPECT_EQ(reg.next_available_name("hero"), "hero");

    reg.add(sprite("hero"));
    EXPECT_EQ(reg.next_available_name("hero"), "hero (1)");

    reg.add(sprite("hero (1)"));
    EXPECT_EQ(reg.next_available_name("hero"), "hero (2)");
    EXPECT_EQ(reg.next_available_name("hero (1)"), "hero (2)");

    reg.add(sprite("hero (7)"));
    EXPECT_EQ(reg.next_available_name("hero (7)"), "hero (8)");

    EXPECT_EQ(reg.next_available_name("hero", "_{}"), "hero_1");
    EXPECT_THROW(reg.next_available_name("hero", "no marker"), std::invalid_argument);
}

TEST(AssetRegistryTest, RemoveAtlasAssets)
{
    AssetRegistry reg;
    reg.add(sprite("a"));
    reg.add(sprite("b"));
    reg.add(sprite("icon", AtlasId::Editor));

    EXPECT_EQ(reg.remove_atlas_assets(AtlasId::Gameplay), 2u);
    EXPECT_EQ(reg.sprite_count(), 1u);
    EXPECT_EQ(reg.sprites(AtlasId::Editor).size(), 1u);
}

TEST(AssetRegistryTest, SnapshotsSurviveReplace)
{
    AssetRegistry reg;
    EXPECT_EQ(reg.get_atlas(AtlasId::Gameplay), nullptr);

    reg.replace_atlas(AtlasId::Gameplay, atlas_with("old"));
    auto snapshot = reg.get_atlas(AtlasId::Gameplay);

    auto previous = reg.replace_atlas(AtlasId::Gameplay, atlas_with("new"));
    EXPECT_EQ(previous, snapshot);
    EXPECT_TRUE(snapshot->has_entry("old"));
    EXPECT_TRUE(reg.get_atlas(AtlasId::Gameplay)->has_entry("new"));
}

TEST(AssetRegistryTest, ReadersSeeWholeAtlases)
{
    AssetRegistry reg;
    reg.replace_atlas(AtlasId::Gameplay, atlas_with("k0"));

    std::atomic<bool> stop{ false };
    std::atomic<int> bad{ 0 };
    std::thread reader([&]
        {
            while (!stop)
            {
                auto a = reg.get_atlas(AtlasId::Gameplay);
                if (!a || a->entry_count() != 1 || a->page_count() != 1)
                    bad++;
            }
        });

    for (int i = 1; i < 500; i++)
        reg.replace_atlas(AtlasId::Gameplay, atlas_with("k" + std::to_string(i)));

    stop = true;
    reader.join();
    EXPECT_EQ(bad.load(), 0);
}
