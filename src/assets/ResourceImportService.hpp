// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ResourceTypes.hpp"
#include "EditorSettings.hpp"
#include "DualPathSerializer.hpp"
#include "ImporterRegistry.hpp"
#include "SerialExecutor.hpp"
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace aforge
{
    struct EngineContext;

    /// Runs import passes over the resource root.
    ///
    /// A full pass (import_resources_async) is posted to a serial strand so
    /// passes never interleave: files are staged per importer, importers pack
    /// in the background and the pass pushes after_content_loaded() onto the
    /// main thread queue to publish. The main thread must pump the queue until
    /// the pass resolves. reload_on_window_foreground() runs the incremental
    /// path synchronously on the main thread.
    class ResourceImportService
    {
    public:
        /// Registers the default importers
        ResourceImportService(EngineContext& ctx, EditorSettings settings);
        ResourceImportService(EngineContext& ctx, EditorSettings settings, assets::ImporterRegistry importers);
        ~ResourceImportService();

        ResourceImportService(const ResourceImportService&) = delete;
        ResourceImportService& operator=(const ResourceImportService&) = delete;

        /// Stage and load everything that changed since the last pass
        /// (everything if force_all). Resolves once the results have been
        /// published from the main thread queue.
        std::shared_future<TaskResult> import_resources_async(bool force_all);

        /// Publish pending importer results. Main thread. Idempotent.
        TaskResult after_content_loaded();

        /// Repack changed files into the live atlases. Main thread.
        /// Skipped while a full pass is in flight.
        TaskResult reload_on_window_foreground();

        /// Keys of hires_images/**/*.png relative to hires_images, extension stripped
        std::vector<std::string> scan_hires_images() const;

        /// Copy the packed source tree into the binary tree. Returns files copied.
        size_t build_bin_content_folder() const;

        EditorSettings settings() const;
        const DualPathSerializer& serializer() const { return serializer_; }
        assets::ImporterRegistry& importers() { return importers_; }

        bool is_busy() const { return strand_.is_busy(); }
        void wait_until_idle() { strand_.wait_idle(); }

    private:
        assets::ImportContext make_import_context(bool force_all) const;
        void set_last_imported(EditorSettings::Clock::time_point t);
        void require_main_thread(const char* what) const;

        EngineContext& ctx_;

        mutable std::mutex settings_mutex_;
        EditorSettings settings_;

        DualPathSerializer serializer_;
        assets::ImporterRegistry importers_;
        SerialExecutor strand_;
    };
}
