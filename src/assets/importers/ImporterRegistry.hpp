// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ResourceImporter.hpp"
#include <filesystem>
#include <memory>
#include <vector>

namespace aforge
{
    class ILogManager;
}

namespace aforge::assets
{
    struct StageSummary
    {
        size_t files = 0;       // Files found under the root
        size_t staged = 0;      // Files accepted by an importer
        size_t changed = 0;     // Staged files marked changed
        size_t skipped = 0;     // Files no importer accepted
    };

    /// Importers in registration order. The first importer whose filter
    /// accepts a file gets it.
    class ImporterRegistry
    {
    public:
        void add(std::unique_ptr<ResourceImporter> importer);

        /// nullptr if no importer accepts the file
        ResourceImporter* find_importer(const ResourceFile& file) const;

        const std::vector<std::unique_ptr<ResourceImporter>>& importers() const { return importers_; }
        size_t size() const { return importers_.size(); }

        /// Clear every stage, then stage all files under `root` (sorted, recursive).
        /// Unmatched files are logged at verbose level.
        /// Throws std::filesystem::filesystem_error if the root can't be read.
        StageSummary stage(const std::filesystem::path& root, const FileChangeTracker& tracker, ILogManager& log);

    private:
        std::vector<std::unique_ptr<ResourceImporter>> importers_;
    };

    /// Font, editor sprite and gameplay sprite importers, in that order
    void add_default_importers(ImporterRegistry& registry);
}
