// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "SpriteAsset.hpp"
#include "AtlasAssembler.hpp"
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace aforge
{
    struct EngineContext;
    struct TaskResult;
}

namespace aforge::assets
{
    struct StagedFile;

    /// Bad sidecar or a sheet that doesn't match its frame layout
    class SpriteSheetError : public std::runtime_error
    {
    public:
        explicit SpriteSheetError(const std::string& msg) : std::runtime_error(msg) {}
    };

    /// Frame layout and animations of a sprite source
    struct SpriteSheetInfo
    {
        bool has_sidecar = false;
        int frame_width = 0;        // 0: whole image is one frame
        int frame_height = 0;
        int origin_x = 0;
        int origin_y = 0;
        std::map<std::string, SpriteAnimation> animations;
    };

    /// "<dir>/<stem>.sprite.json"
    std::filesystem::path sidecar_path(const std::filesystem::path& image_path);

    SpriteSheetInfo sprite_sheet_from_json(const nlohmann::json& j);

    /// Reads the sidecar next to the image if there is one
    SpriteSheetInfo load_sprite_sheet_info(const std::filesystem::path& image_path);

    /// "<key>_<index, 4 digits>" for multi-frame sheets, the key itself otherwise
    std::string frame_key(const std::string& key, int frame_index, int frame_count);

    /// Frames of one source, ready for packing, and the sprite asset describing them
    struct SpritePack
    {
        std::vector<SourceImage> frames;
        SpriteAsset asset;
    };

    /// Slice `image` row-major into frames and build the asset.
    /// Throws SpriteSheetError if the image isn't a whole number of frames
    /// or an animation references a missing frame.
    SpritePack build_sprite_pack(
        const std::string& key,
        const Image& image,
        const SpriteSheetInfo& info,
        AtlasId atlas,
        const std::string& atlas_name);

    struct SpriteAtlasBuild
    {
        std::shared_ptr<TextureAtlas> atlas;    // nullptr if no file could be used
        std::vector<SpriteAsset> sprites;
        size_t image_count = 0;                 // Source files that made it into the atlas
    };

    /// Decode, slice and pack sprite sources into one atlas.
    /// Files that fail to decode or slice are logged, recorded in `res` and skipped.
    /// Pack failures (PackError, AtlasError) propagate.
    /// Sprites reference `asset_atlas`, whatever id the packed atlas gets.
    SpriteAtlasBuild build_sprite_atlas(
        const std::vector<StagedFile>& files,
        const std::filesystem::path& resources_root,
        const PackOptions& options,
        AtlasId atlas_id,
        AtlasId asset_atlas,
        EngineContext& ctx,
        TaskResult& res);
}
