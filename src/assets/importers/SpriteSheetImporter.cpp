// Licensed under the MIT License. See LICENSE file for details.

#include "SpriteSheetImporter.hpp"
#include "AssetRegistry.hpp"
#include "AtlasSerialization.hpp"
#include "SpriteAssetSerialization.hpp"
#include "ThreadPool.hpp"
#include "LogMacros.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace aforge::assets
{
    SpriteSheetImporter::SpriteSheetImporter(std::string name, ImporterFilter filter, AtlasId atlas)
        : ResourceImporter(std::move(name), std::move(filter))
        , atlas_(atlas)
        , controller_(atlas)
    {
    }

    EditorSpriteImporter::EditorSpriteImporter()
        : SpriteSheetImporter("EditorSpriteImporter",
            ImporterFilter{ {".png"}, FilterType::OnlyTheseFolders, {"editor"} },
            AtlasId::Editor)
    {
    }

    GameplaySpriteImporter::GameplaySpriteImporter()
        : SpriteSheetImporter("GameplaySpriteImporter",
            ImporterFilter{ {".png"}, FilterType::ExceptTheseFolders, {"editor", "hires_images", "fonts"} },
            AtlasId::Gameplay)
    {
    }

    bool SpriteSheetImporter::has_changed(const ResourceFile& file, const FileChangeTracker& tracker) const
    {
        return tracker.is_changed(file) || tracker.is_changed(sidecar_path(file.path));
    }

    bool SpriteSheetImporter::has_pending() const
    {
        std::lock_guard lock(pending_mutex_);
        return pending_.has_value();
    }

    std::shared_future<TaskResult> SpriteSheetImporter::load_staged_content(bool reload, const ImportContext& ictx)
    {
        auto& ctx = ictx.ctx;

        if (reload)
        {
            TaskResult res;
            res.type = TaskResult::TaskType::Reload;
            const auto outcome = controller_.run(staged().all(), ictx, res);
            AFORGE_LOG_VERBOSE(&ctx, "%s reload: %s", name().c_str(), to_string(outcome));
            return ready(std::move(res));
        }

        if (staged().empty())
        {
            AFORGE_LOG_INFO(&ctx, "%s: no files staged, atlas '%s' left as is", name().c_str(), to_string(atlas_));
            TaskResult res;
            res.type = TaskResult::TaskType::Import;
            return ready(std::move(res));
        }

        const bool reuse = !ictx.force_all &&
            ictx.settings.only_reload_atlas_with_changes &&
            staged().changed_count() == 0 &&
            fs::exists(ictx.settings.bin_root() / atlas_descriptor_path(to_string(atlas_)));

        // Runs on the pool; the staged list is copied since the stage is cleared by the next pass
        std::vector<StagedFile> files = staged().all();
        auto fut = ctx.thread_pool->queue_task([this, files = std::move(files), ictx, reuse]() -> TaskResult
            {
                TaskResult res;
                try
                {
                    res = reuse ? reuse_saved(files.size(), ictx) : pack_all(files, ictx);
                }
                catch (const std::exception& ex)
                {
                    AFORGE_LOG_ERROR(&ictx.ctx, "%s: packing atlas '%s' failed: %s", name().c_str(), to_string(atlas_), ex.what());
                    res.add_result(Guid{}, false, ex.what());
                }
                res.type = TaskResult::TaskType::Import;
                return res;
            });
        return fut.share();
    }

    TaskResult SpriteSheetImporter::pack_all(const std::vector<StagedFile>& files, const ImportContext& ictx)
    {
        TaskResult res;
        auto build = build_sprite_atlas(files, ictx.resources_root, ictx.settings.pack, atlas_, atlas_, ictx.ctx, res);
        if (!build.atlas)
        {
            AFORGE_LOG_ERROR(&ictx.ctx, "%s: atlas '%s' has no entries, nothing published", name().c_str(), to_string(atlas_));
            res.add_result(Guid{}, false, std::string("Atlas '") + to_string(atlas_) + "' has no entries");
            return res;
        }

        std::lock_guard lock(pending_mutex_);
        pending_ = PendingPack{ std::move(build.atlas), std::move(build.sprites), build.image_count, false };
        return res;
    }

    TaskResult SpriteSheetImporter::reuse_saved(size_t image_count, const ImportContext& ictx)
    {
        TaskResult res;
        auto& ctx = ictx.ctx;
        const fs::path bin_root = ictx.settings.bin_root();
        const std::string atlas_name = to_string(atlas_);

        auto atlas = serializers::load_atlas(bin_root, atlas_name, *ctx.image_decoder);
        if (!atlas)
            throw AtlasError("Saved atlas '" + atlas_name + "' disappeared");

        std::vector<SpriteAsset> sprites;
        const fs::path assets_dir = bin_root / serializers::generated_assets_dir(atlas_name);
        if (fs::is_directory(assets_dir))
        {
            std::vector<fs::path> files;
            for (const auto& entry : fs::recursive_directory_iterator(assets_dir))
                if (entry.is_regular_file() && entry.path().extension() == ".json")
                    files.push_back(entry.path());
            std::sort(files.begin(), files.end());

            for (const auto& path : files)
            {
                std::ifstream in(path);
                nlohmann::json j;
                in >> j;
                sprites.push_back(serializers::sprite_asset_from_json(j));
            }
        }

        AFORGE_LOG_INFO(&ctx, "%s: no changes, reusing saved atlas '%s'", name().c_str(), atlas_name.c_str());

        std::lock_guard lock(pending_mutex_);
        pending_ = PendingPack{ std::move(atlas), std::move(sprites), image_count, true };
        return res;
    }

    TaskResult SpriteSheetImporter::flush(const ImportContext& ictx)
    {
        auto& ctx = ictx.ctx;
        TaskResult res;
        res.type = TaskResult::TaskType::Flush;

        std::optional<PendingPack> pending;
        {
            std::lock_guard lock(pending_mutex_);
            pending.swap(pending_);
        }
        if (!pending)
            return res;

        auto& registry = *ctx.asset_registry;
        auto& atlas = pending->atlas;
        const std::string atlas_name = to_string(atlas_);

        try
        {
            atlas->upload_pages(ctx.texture_uploader);
            registry.replace_atlas(atlas_, atlas);

            registry.remove_atlas_assets(atlas_);
            if (!pending->reused)
                ictx.serializer.clear_directory(serializers::generated_assets_dir(atlas_name));

            for (auto& sprite : pending->sprites)
            {
                const Guid guid = sprite.guid;
                if (!pending->reused)
                {
                    const auto status = serializers::serialize_sprite_asset(sprite, ictx.serializer);
                    if (status == SaveStatus::SourceWriteFailed)
                    {
                        res.add_result(guid, false, "Failed to save sprite '" + sprite.name + "'");
                        continue;
                    }
                }
                const std::string sprite_name = sprite.name;
                registry.add(std::move(sprite));
                res.add_result(guid, true, sprite_name);
            }

            if (!pending->reused)
            {
                const auto status = serializers::serialize_atlas(*atlas, ictx.serializer, { true, true });
                if (status == SaveStatus::SourceWriteFailed)
                    res.add_result(Guid{}, false, "Failed to save atlas '" + atlas_name + "'");
            }
            controller_.clear_reloaded();

            int max_w = 0, max_h = 0;
            for (const auto& page : atlas->pages())
            {
                max_w = std::max(max_w, page.width);
                max_h = std::max(max_h, page.height);
            }
            AFORGE_LOG_INFO(&ctx, "Pack '%s' (%zu images, %d pages, up to %dx%d) completed with %zu entries",
                atlas_name.c_str(), pending->image_count, atlas->page_count(), max_w, max_h, atlas->entry_count());
        }
        catch (const std::exception& ex)
        {
            AFORGE_LOG_ERROR(&ctx, "%s: publishing atlas '%s' failed: %s", name().c_str(), atlas_name.c_str(), ex.what());
            res.add_result(Guid{}, false, ex.what());
        }
        return res;
    }
}
