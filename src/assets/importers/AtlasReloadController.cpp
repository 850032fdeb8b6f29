// Licensed under the MIT License. See LICENSE file for details.

#include "AtlasReloadController.hpp"
#include "SpriteSheet.hpp"
#include "AssetRegistry.hpp"
#include "AtlasSerialization.hpp"
#include "SpriteAssetSerialization.hpp"
#include "LogMacros.h"

namespace aforge::assets
{
    const char* to_string(ReloadState state)
    {
        switch (state)
        {
        case ReloadState::Idle: return "Idle";
        case ReloadState::Staging: return "Staging";
        case ReloadState::Packing: return "Packing";
        case ReloadState::Merging: return "Merging";
        }
        return "Unknown";
    }

    const char* to_string(ReloadOutcome outcome)
    {
        switch (outcome)
        {
        case ReloadOutcome::NothingToDo: return "NothingToDo";
        case ReloadOutcome::Merged: return "Merged";
        case ReloadOutcome::Failed: return "Failed";
        }
        return "Unknown";
    }

    AtlasReloadController::AtlasReloadController(AtlasId target)
        : target_(target)
    {
    }

    TextureAtlasPtr AtlasReloadController::live_atlas(const ImportContext& ictx) const
    {
        auto& ctx = ictx.ctx;
        if (auto live = ctx.asset_registry->get_atlas(target_))
            return live;

        // Nothing published yet this session: start from the last saved atlas
        try
        {
            return serializers::load_atlas(ictx.settings.bin_root(), to_string(target_), *ctx.image_decoder);
        }
        catch (const std::exception& ex)
        {
            AFORGE_LOG_WARN(&ctx, "Ignoring saved atlas '%s': %s", to_string(target_), ex.what());
            return nullptr;
        }
    }

    ReloadOutcome AtlasReloadController::run(const std::vector<StagedFile>& staged, const ImportContext& ictx, TaskResult& res)
    {
        auto& ctx = ictx.ctx;
        const std::string target_name = to_string(target_);

        set_state(ReloadState::Staging);
        std::vector<StagedFile> changed;
        for (const auto& f : staged)
            if (f.changed) changed.push_back(f);

        if (changed.empty())
        {
            set_state(ReloadState::Idle);
            return ReloadOutcome::NothingToDo;
        }

        try
        {
            set_state(ReloadState::Packing);
            auto build = build_sprite_atlas(
                changed, ictx.resources_root, ictx.settings.pack, AtlasId::Temporary, target_, ctx, res);
            if (!build.atlas)
            {
                AFORGE_LOG_ERROR(&ctx, "Reload of atlas '%s' produced no entries", target_name.c_str());
                res.add_result(Guid{}, false, "Reload of atlas '" + target_name + "' produced no entries");
                set_state(ReloadState::Idle);
                return ReloadOutcome::Failed;
            }

            const auto tmp_status = serializers::serialize_atlas(*build.atlas, ictx.serializer, { false, false });
            if (tmp_status == SaveStatus::SourceWriteFailed)
                throw std::runtime_error("Could not write the temporary atlas");

            set_state(ReloadState::Merging);
            auto& registry = *ctx.asset_registry;

            // Persist the new sprite assets first; a sprite whose source write
            // fails keeps its old asset and its old frames
            std::vector<SpriteAsset> accepted;
            std::set<std::string> superseded;
            std::set<std::string> rejected;
            for (auto& sprite : build.sprites)
            {
                const auto status = serializers::serialize_sprite_asset(sprite, ictx.serializer);
                if (status == SaveStatus::SourceWriteFailed)
                {
                    res.add_result(sprite.guid, false, "Failed to save sprite '" + sprite.name + "'");
                    rejected.insert(sprite.frames.begin(), sprite.frames.end());
                    continue;
                }
                if (auto old = registry.try_get(sprite.guid))
                    superseded.insert(old->frames.begin(), old->frames.end());
                accepted.push_back(std::move(sprite));
            }

            const auto live = live_atlas(ictx);
            auto merged = merge_atlases(live.get(), *build.atlas, target_, target_name, superseded, rejected);
            merged->upload_pages(ctx.texture_uploader);

            // Commit: nothing below throws for valid sprite GUIDs
            for (auto& sprite : accepted)
            {
                const Guid guid = sprite.guid;
                for (auto& k : sprite.frames)
                    reloaded_keys_.insert(k);
                res.add_result(guid, true, sprite.name);
                registry.remove(guid);
                registry.add(std::move(sprite));
            }
            registry.replace_atlas(target_, merged);

            const auto status = serializers::serialize_atlas(*merged, ictx.serializer, { true, true });
            if (status == SaveStatus::SourceWriteFailed)
                res.add_result(Guid{}, false, "Failed to save merged atlas '" + target_name + "'");

            AFORGE_LOG_INFO(&ctx, "Reloaded %zu images into atlas '%s' (%d pages, %zu entries, %zu keys reloaded since the last full pack)",
                build.image_count, target_name.c_str(), merged->page_count(), merged->entry_count(), reloaded_keys_.size());
        }
        catch (const std::exception& ex)
        {
            AFORGE_LOG_ERROR(&ctx, "Reload of atlas '%s' failed: %s", target_name.c_str(), ex.what());
            res.add_result(Guid{}, false, ex.what());
            set_state(ReloadState::Idle);
            return ReloadOutcome::Failed;
        }

        set_state(ReloadState::Idle);
        return ReloadOutcome::Merged;
    }
}
