// Licensed under the MIT License. See LICENSE file for details.

#include "SpriteSheet.hpp"
#include "StagingBuffer.hpp"
#include "ResourceTypes.hpp"
#include "LogMacros.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace aforge::assets
{
    fs::path sidecar_path(const fs::path& image_path)
    {
        fs::path p = image_path.parent_path() / image_path.stem();
        p += ".sprite.json";
        return p;
    }

    SpriteSheetInfo sprite_sheet_from_json(const nlohmann::json& j)
    {
        SpriteSheetInfo info;
        info.has_sidecar = true;
        info.frame_width = j.value("frame_width", 0);
        info.frame_height = j.value("frame_height", 0);
        if (info.frame_width < 0 || info.frame_height < 0)
            throw SpriteSheetError("Frame size must not be negative");

        if (j.contains("origin"))
        {
            info.origin_x = j.at("origin").at(0).get<int>();
            info.origin_y = j.at("origin").at(1).get<int>();
        }

        if (j.contains("animations"))
        {
            for (const auto& [name, ja] : j.at("animations").items())
            {
                SpriteAnimation anim;
                anim.frames = ja.at("frames").get<std::vector<int>>();
                if (ja.contains("durations_ms"))
                    anim.durations_ms = ja.at("durations_ms").get<std::vector<int>>();
                else
                    anim.durations_ms.assign(anim.frames.size(), 0);

                if (anim.frames.size() != anim.durations_ms.size())
                    throw SpriteSheetError("Animation '" + name + "' has " + std::to_string(anim.frames.size()) +
                        " frames but " + std::to_string(anim.durations_ms.size()) + " durations");
                info.animations.emplace(name, std::move(anim));
            }
        }
        return info;
    }

    SpriteSheetInfo load_sprite_sheet_info(const fs::path& image_path)
    {
        const auto path = sidecar_path(image_path);
        if (!fs::exists(path))
            return SpriteSheetInfo{};

        std::ifstream file(path);
        if (!file)
            throw SpriteSheetError("Failed to open " + path.string());

        try
        {
            nlohmann::json j;
            file >> j;
            return sprite_sheet_from_json(j);
        }
        catch (const nlohmann::json::exception& ex)
        {
            throw SpriteSheetError(path.string() + ": " + ex.what());
        }
    }

    std::string frame_key(const std::string& key, int frame_index, int frame_count)
    {
        if (frame_count <= 1)
            return key;
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "_%04d", frame_index);
        return key + suffix;
    }

    SpritePack build_sprite_pack(
        const std::string& key,
        const Image& image,
        const SpriteSheetInfo& info,
        AtlasId atlas,
        const std::string& atlas_name)
    {
        if (image.empty())
            throw SpriteSheetError("Sprite '" + key + "' has no pixels");

        const int fw = info.frame_width > 0 ? info.frame_width : image.width;
        const int fh = info.frame_height > 0 ? info.frame_height : image.height;
        if (image.width % fw != 0 || image.height % fh != 0)
            throw SpriteSheetError("Sprite '" + key + "' (" + std::to_string(image.width) + "x" + std::to_string(image.height) +
                ") is not a multiple of its frame size " + std::to_string(fw) + "x" + std::to_string(fh));

        const int columns = image.width / fw;
        const int rows = image.height / fh;
        const int count = columns * rows;

        SpritePack pack;
        pack.asset.guid = sprite_guid(atlas_name, key);
        pack.asset.name = key;
        pack.asset.atlas = atlas;
        pack.asset.width = fw;
        pack.asset.height = fh;
        pack.asset.origin_x = info.origin_x;
        pack.asset.origin_y = info.origin_y;

        const size_t row_bytes = static_cast<size_t>(fw) * Image::channels;
        for (int i = 0; i < count; i++)
        {
            const int fx = (i % columns) * fw;
            const int fy = (i / columns) * fh;

            auto frame = std::make_shared<Image>(fw, fh);
            for (int y = 0; y < fh; y++)
                std::memcpy(frame->at(0, y), image.at(fx, fy + y), row_bytes);

            std::string fkey = frame_key(key, i, count);
            pack.asset.frames.push_back(fkey);
            pack.frames.push_back(SourceImage{ std::move(fkey), std::move(frame) });
        }

        if (info.animations.empty())
        {
            SpriteAnimation anim;
            for (int i = 0; i < count; i++)
            {
                anim.frames.push_back(i);
                anim.durations_ms.push_back(0);
            }
            pack.asset.animations.emplace("", std::move(anim));
        }
        else
        {
            for (const auto& [name, anim] : info.animations)
            {
                for (int f : anim.frames)
                    if (f < 0 || f >= count)
                        throw SpriteSheetError("Animation '" + name + "' of sprite '" + key + "' references frame " +
                            std::to_string(f) + " of " + std::to_string(count));
            }
            pack.asset.animations = info.animations;
        }
        return pack;
    }

    SpriteAtlasBuild build_sprite_atlas(
        const std::vector<StagedFile>& files,
        const fs::path& resources_root,
        const PackOptions& options,
        AtlasId atlas_id,
        AtlasId asset_atlas,
        EngineContext& ctx,
        TaskResult& res)
    {
        const std::string asset_atlas_name = to_string(asset_atlas);

        SpriteAtlasBuild build;
        std::vector<SourceImage> sources;
        for (const auto& staged : files)
        {
            const auto& path = staged.file.path;
            const std::string key = make_entry_key(resources_root, path);
            try
            {
                const Image image = ctx.image_decoder->decode(path);
                const SpriteSheetInfo info = load_sprite_sheet_info(path);
                SpritePack pack = build_sprite_pack(key, image, info, asset_atlas, asset_atlas_name);

                for (auto& frame : pack.frames)
                    sources.push_back(std::move(frame));
                build.sprites.push_back(std::move(pack.asset));
                build.image_count++;
            }
            catch (const std::exception& ex)
            {
                AFORGE_LOG_ERROR(&ctx, "Skipping %s: %s", path.string().c_str(), ex.what());
                res.add_result(sprite_guid(asset_atlas_name, key), false, ex.what());
            }
        }

        AtlasAssembler assembler(options);
        build.atlas = assembler.assemble(atlas_id, to_string(atlas_id), std::move(sources));
        if (!build.atlas)
            build.sprites.clear();
        return build;
    }
}
