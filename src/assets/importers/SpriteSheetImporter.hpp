// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ResourceImporter.hpp"
#include "AtlasReloadController.hpp"
#include "SpriteSheet.hpp"
#include <mutex>
#include <optional>

namespace aforge::assets
{
    /// Packs staged .png sprite sources into one atlas
    class SpriteSheetImporter : public ResourceImporter
    {
    public:
        SpriteSheetImporter(std::string name, ImporterFilter filter, AtlasId atlas);

        AtlasId atlas_id() const { return atlas_; }

        bool has_changed(const ResourceFile& file, const FileChangeTracker& tracker) const override;
        std::shared_future<TaskResult> load_staged_content(bool reload, const ImportContext& ictx) override;
        TaskResult flush(const ImportContext& ictx) override;
        bool has_pending() const override;

        const AtlasReloadController& reload_controller() const { return controller_; }

    private:
        struct PendingPack
        {
            std::shared_ptr<TextureAtlas> atlas;
            std::vector<SpriteAsset> sprites;
            size_t image_count = 0;
            bool reused = false;    // Loaded from the last saved atlas, nothing to persist
        };

        TaskResult pack_all(const std::vector<StagedFile>& files, const ImportContext& ictx);
        TaskResult reuse_saved(size_t image_count, const ImportContext& ictx);

        AtlasId atlas_;
        AtlasReloadController controller_;

        mutable std::mutex pending_mutex_;
        std::optional<PendingPack> pending_;
    };

    class EditorSpriteImporter : public SpriteSheetImporter
    {
    public:
        EditorSpriteImporter();
    };

    class GameplaySpriteImporter : public SpriteSheetImporter
    {
    public:
        GameplaySpriteImporter();
    };
}
