// Licensed under the MIT License. See LICENSE file for details.

#include "SpriteAssetSerialization.hpp"
#include <nlohmann/json.hpp>

namespace aforge::serializers
{
    nlohmann::json sprite_asset_to_json(const assets::SpriteAsset& asset)
    {
        nlohmann::json j;
        j["guid"] = asset.guid.to_string();
        j["name"] = asset.name;
        j["atlas"] = to_string(asset.atlas);
        j["frames"] = asset.frames;
        j["size"] = { asset.width, asset.height };
        j["origin"] = { asset.origin_x, asset.origin_y };

        nlohmann::json anims = nlohmann::json::object();
        for (const auto& [name, anim] : asset.animations)
            anims[name] = { {"frames", anim.frames}, {"durations_ms", anim.durations_ms} };
        j["animations"] = std::move(anims);
        return j;
    }

    assets::SpriteAsset sprite_asset_from_json(const nlohmann::json& j)
    {
        assets::SpriteAsset asset;
        asset.guid = Guid::from_string(j.at("guid").get<std::string>());
        asset.name = j.at("name").get<std::string>();

        const auto atlas_str = j.at("atlas").get<std::string>();
        const auto atlas = atlas_id_from_string(atlas_str);
        if (!atlas)
            throw AtlasError("Sprite '" + asset.name + "' references unknown atlas '" + atlas_str + "'");
        asset.atlas = *atlas;

        asset.frames = j.at("frames").get<std::vector<std::string>>();
        asset.width = j.at("size").at(0).get<int>();
        asset.height = j.at("size").at(1).get<int>();
        asset.origin_x = j.at("origin").at(0).get<int>();
        asset.origin_y = j.at("origin").at(1).get<int>();

        for (const auto& [name, ja] : j.at("animations").items())
        {
            assets::SpriteAnimation anim;
            anim.frames = ja.at("frames").get<std::vector<int>>();
            anim.durations_ms = ja.at("durations_ms").get<std::vector<int>>();
            asset.animations.emplace(name, std::move(anim));
        }
        return asset;
    }

    std::string generated_assets_dir(const std::string& atlas_name)
    {
        return "assets/generated/" + atlas_name;
    }

    std::string sprite_asset_path(const std::string& atlas_name, const std::string& asset_name)
    {
        return generated_assets_dir(atlas_name) + "/" + asset_name + ".json";
    }

    SaveStatus serialize_sprite_asset(
        const assets::SpriteAsset& asset,
        const DualPathSerializer& serializer)
    {
        return serializer.save_json(sprite_asset_path(to_string(asset.atlas), asset.name), sprite_asset_to_json(asset));
    }
}
