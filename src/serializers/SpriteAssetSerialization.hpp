// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "SpriteAsset.hpp"
#include "DualPathSerializer.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace aforge::serializers
{
    nlohmann::json sprite_asset_to_json(const assets::SpriteAsset& asset);
    assets::SpriteAsset sprite_asset_from_json(const nlohmann::json& j);

    /// "assets/generated/<atlas name>"
    std::string generated_assets_dir(const std::string& atlas_name);

    /// "assets/generated/<atlas name>/<asset name>.json"
    std::string sprite_asset_path(const std::string& atlas_name, const std::string& asset_name);

    SaveStatus serialize_sprite_asset(
        const assets::SpriteAsset& asset,
        const DualPathSerializer& serializer);
}
