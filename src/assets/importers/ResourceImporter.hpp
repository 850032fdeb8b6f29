// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ImporterFilter.hpp"
#include "StagingBuffer.hpp"
#include "FileChangeTracker.hpp"
#include "ResourceTypes.hpp"
#include "EditorSettings.hpp"
#include <future>
#include <memory>
#include <string>

namespace aforge
{
    struct EngineContext;
    class DualPathSerializer;
}

namespace aforge::assets
{
    /// What an importer gets to see of the pass it runs in.
    /// `settings` is a snapshot taken when the pass started.
    struct ImportContext
    {
        EngineContext& ctx;
        const DualPathSerializer& serializer;
        EditorSettings settings;
        std::filesystem::path resources_root;   // Absolute
        bool force_all = false;
    };

    /// Base of all importers. Staging is shared; loading and flushing is
    /// what each importer does with its staged files.
    class ResourceImporter
    {
    public:
        ResourceImporter(std::string name, ImporterFilter filter)
            : name_(std::move(name))
            , filter_(std::move(filter))
        {
        }

        virtual ~ResourceImporter() = default;

        ResourceImporter(const ResourceImporter&) = delete;
        ResourceImporter& operator=(const ResourceImporter&) = delete;

        const std::string& name() const { return name_; }
        const ImporterFilter& filter() const { return filter_; }
        const StagingBuffer& staged() const { return stage_; }

        void clear_stage() { stage_.clear(); }
        void stage_file(ResourceFile file, bool changed) { stage_.stage(std::move(file), changed); }

        /// Change detection for a staged file. Importers with companion files
        /// (sidecars, configs) also report the file changed when those are.
        virtual bool has_changed(const ResourceFile& file, const FileChangeTracker& tracker) const
        {
            return tracker.is_changed(file);
        }

        /// Process the staged files.
        /// reload == false: background work; its result is published by flush().
        /// reload == true: changed files only, published before returning. Main thread.
        virtual std::shared_future<TaskResult> load_staged_content(bool reload, const ImportContext& ictx) = 0;

        /// Publish a pending background result. Main thread.
        virtual TaskResult flush(const ImportContext& ictx);

        virtual bool has_pending() const { return false; }

    protected:
        static std::shared_future<TaskResult> ready(TaskResult result);

    private:
        std::string name_;
        ImporterFilter filter_;
        StagingBuffer stage_;
    };
}
