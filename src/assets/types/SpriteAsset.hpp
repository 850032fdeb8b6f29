// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <map>
#include <string>
#include <vector>

#include "Guid.h"
#include "TextureAtlas.hpp"

namespace aforge::assets
{
    // -------------------------------------------------------------------------
    // SpriteAnimation
    // -------------------------------------------------------------------------

    /// @brief Named clip over the frames of a sprite.
    /// frames and durations_ms have the same length.
    struct SpriteAnimation
    {
        /// @brief Indices into SpriteAsset::frames.
        std::vector<int> frames;
        /// @brief Display time per frame.
        std::vector<int> durations_ms;

        int total_ms() const
        {
            int t = 0;
            for (int d : durations_ms) t += d;
            return t;
        }

        bool operator==(const SpriteAnimation&) const = default;
    };

    // -------------------------------------------------------------------------
    // SpriteAsset
    // -------------------------------------------------------------------------

    /// @brief Sprite produced by packing one image file.
    /// The GUID is derived from the atlas and entry key, so reimporting the
    /// same file produces the same GUID.
    struct SpriteAsset
    {
        Guid guid;
        std::string name;
        AtlasId atlas = AtlasId::Gameplay;

        /// @brief Atlas entry keys, one per frame.
        std::vector<std::string> frames;

        /// @brief Animations by name. A sprite without sidecar has one clip named "".
        std::map<std::string, SpriteAnimation> animations;

        int width = 0;      // Frame size
        int height = 0;
        int origin_x = 0;
        int origin_y = 0;

        bool operator==(const SpriteAsset&) const = default;
    };

    /// @brief Stable GUID of the sprite packed from `entry_key` into `atlas_name`
    inline Guid sprite_guid(const std::string& atlas_name, const std::string& entry_key)
    {
        return Guid::from_name(atlas_name + ":" + entry_key);
    }

} // namespace aforge::assets
