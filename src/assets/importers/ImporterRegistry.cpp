// Licensed under the MIT License. See LICENSE file for details.

#include "ImporterRegistry.hpp"
#include "FontImporter.hpp"
#include "SpriteSheetImporter.hpp"
#include "ILogManager.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace aforge::assets
{
    void ImporterRegistry::add(std::unique_ptr<ResourceImporter> importer)
    {
        if (!importer)
            throw std::invalid_argument("ImporterRegistry: null importer");
        importers_.push_back(std::move(importer));
    }

    ResourceImporter* ImporterRegistry::find_importer(const ResourceFile& file) const
    {
        for (const auto& importer : importers_)
            if (importer->filter().accepts(file.extension, file.folder))
                return importer.get();
        return nullptr;
    }

    StageSummary ImporterRegistry::stage(const fs::path& root, const FileChangeTracker& tracker, ILogManager& log)
    {
        for (auto& importer : importers_)
            importer->clear_stage();

        std::vector<fs::path> files;
        for (const auto& entry : fs::recursive_directory_iterator(root))
            if (entry.is_regular_file())
                files.push_back(entry.path());
        std::sort(files.begin(), files.end());

        StageSummary summary;
        for (const auto& path : files)
        {
            summary.files++;
            ResourceFile file = ResourceFile::from_path(root, path);

            ResourceImporter* importer = find_importer(file);
            if (!importer)
            {
                log.log("[VERBOSE] No importer for %s", path.string().c_str());
                summary.skipped++;
                continue;
            }

            const bool changed = importer->has_changed(file, tracker);
            importer->stage_file(std::move(file), changed);
            summary.staged++;
            if (changed) summary.changed++;
        }
        return summary;
    }

    void add_default_importers(ImporterRegistry& registry)
    {
        registry.add(std::make_unique<FontImporter>());
        registry.add(std::make_unique<EditorSpriteImporter>());
        registry.add(std::make_unique<GameplaySpriteImporter>());
    }
}
