// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "TextureAtlas.hpp"
#include "DualPathSerializer.hpp"
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <memory>

namespace aforge
{
    class IImageDecoder;
}

namespace aforge::serializers
{
    nlohmann::json atlas_to_json(const TextureAtlas& atlas);

    /// Pages are created without pixels. Throws AtlasError on unknown ids
    /// or entries referencing a missing page, nlohmann::json::exception on
    /// malformed input.
    std::shared_ptr<TextureAtlas> atlas_from_json(const nlohmann::json& j);

    struct AtlasSerializeOptions
    {
        bool log = true;                // Report the save at info level
        bool delete_temporary = false;  // Remove atlas/temporary* afterwards
    };

    /// Write page images, then the descriptor, through the serializer.
    /// Page files left over from a larger previous atlas are deleted.
    /// Throws AtlasError for an invalid (empty) atlas or pages without pixels.
    SaveStatus serialize_atlas(
        const TextureAtlas& atlas,
        const DualPathSerializer& serializer,
        const AtlasSerializeOptions& options = {});

    /// Load descriptor and decode pages from `root` (a packed or binary tree).
    /// Returns nullptr if the descriptor doesn't exist.
    std::shared_ptr<TextureAtlas> load_atlas(
        const std::filesystem::path& root,
        const std::string& atlas_name,
        const IImageDecoder& decoder);
}
