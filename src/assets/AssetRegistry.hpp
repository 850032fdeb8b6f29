// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "SpriteAsset.hpp"
#include "TextureAtlas.hpp"
#include "Guid.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace aforge
{
    /// Live assets: sprite assets by GUID and one published atlas per atlas id.
    /// Thread-safe. Atlases are immutable snapshots; replace_atlas swaps the
    /// pointer, so holders of an old snapshot keep a complete atlas until they
    /// drop it (its page textures are released then).
    class AssetRegistry
    {
    public:
        using SpriteAssetPtr = std::shared_ptr<const assets::SpriteAsset>;

        AssetRegistry() = default;
        AssetRegistry(const AssetRegistry&) = delete;
        AssetRegistry& operator=(const AssetRegistry&) = delete;

        // --- Sprite assets ---

        /// nullptr if not present
        SpriteAssetPtr try_get(const Guid& guid) const;

        /// Throws std::out_of_range if not present
        SpriteAssetPtr get(const Guid& guid) const;

        bool contains(const Guid& guid) const;

        /// Throws std::invalid_argument for an invalid or already present GUID
        void add(assets::SpriteAsset asset);

        /// Returns false if the GUID was not present
        bool remove(const Guid& guid);

        /// Remove all sprites referencing an atlas. Returns the number removed.
        size_t remove_atlas_assets(AtlasId atlas);

        /// GUIDs of assets with the given name (case-insensitive)
        std::vector<Guid> find_by_name(std::string_view name) const;

        /// `name` if unused, otherwise the first free name made by appending `pattern`
        /// (which must contain "{}") with a counter. A trailing counter already in
        /// `name` is continued from: taken "hero" -> "hero (1)", taken "hero (1)" -> "hero (2)".
        std::string next_available_name(const std::string& name, std::string_view pattern = " ({})") const;

        std::vector<SpriteAssetPtr> sprites(AtlasId atlas) const;
        size_t sprite_count() const;

        // --- Atlases ---

        /// Current snapshot, or nullptr if none is published
        TextureAtlasPtr get_atlas(AtlasId id) const;

        /// Publish a new snapshot. Returns the previous one.
        TextureAtlasPtr replace_atlas(AtlasId id, TextureAtlasPtr atlas);

        std::string to_string() const;

    private:
        bool name_in_use(std::string_view name) const;  // Caller holds mutex_

        mutable std::mutex mutex_;
        std::unordered_map<Guid, SpriteAssetPtr> sprites_;
        std::map<AtlasId, TextureAtlasPtr> atlases_;
    };
}
