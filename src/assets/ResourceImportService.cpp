// Licensed under the MIT License. See LICENSE file for details.

#include "ResourceImportService.hpp"
#include "EngineContext.hpp"
#include "MainThreadQueue.hpp"
#include "ThreadPool.hpp"
#include "AtlasAssembler.hpp"
#include "LogMacros.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;

namespace aforge
{
    ResourceImportService::ResourceImportService(EngineContext& ctx, EditorSettings settings)
        : ResourceImportService(ctx, std::move(settings), [] {
                assets::ImporterRegistry r;
                assets::add_default_importers(r);
                return r;
            }())
    {
    }

    ResourceImportService::ResourceImportService(EngineContext& ctx, EditorSettings settings, assets::ImporterRegistry importers)
        : ctx_(ctx)
        , settings_(std::move(settings))
        , serializer_(settings_.packed_root(), settings_.bin_root())
        , importers_(std::move(importers))
        , strand_(*ctx.thread_pool)
    {
    }

    ResourceImportService::~ResourceImportService()
    {
        // Strand tasks reference this object; a pass in flight may be waiting
        // for its flush on the main thread
        auto& queue = *ctx_.main_thread_queue;
        if (queue.is_owner_thread())
        {
            while (strand_.is_busy())
            {
                queue.wait_for_work(std::chrono::milliseconds(5));
                queue.execute_all();
            }
        }
        strand_.wait_idle();
    }

    EditorSettings ResourceImportService::settings() const
    {
        std::lock_guard lock(settings_mutex_);
        return settings_;
    }

    void ResourceImportService::set_last_imported(EditorSettings::Clock::time_point t)
    {
        std::lock_guard lock(settings_mutex_);
        settings_.last_imported = t;
        if (settings_.file_path.empty())
            return;
        try
        {
            settings_.save();
        }
        catch (const std::exception& ex)
        {
            AFORGE_LOG_WARN(&ctx_, "Could not save settings: %s", ex.what());
        }
    }

    assets::ImportContext ResourceImportService::make_import_context(bool force_all) const
    {
        auto s = settings();
        auto root = fs::absolute(s.resources_root()).lexically_normal();
        return assets::ImportContext{ ctx_, serializer_, std::move(s), std::move(root), force_all };
    }

    void ResourceImportService::require_main_thread(const char* what) const
    {
        if (!ctx_.main_thread_queue->is_owner_thread())
            throw std::logic_error(std::string(what) + " must be called on the main thread");
    }

    std::shared_future<TaskResult> ResourceImportService::import_resources_async(bool force_all)
    {
        auto prom = std::make_shared<std::promise<TaskResult>>();
        auto fut = prom->get_future().share();

        strand_.post([this, force_all, prom]() mutable {
            TaskResult res; res.type = TaskResult::TaskType::Import;
            const auto pass_start = EditorSettings::Clock::now();

            auto ictx = std::make_shared<assets::ImportContext>(make_import_context(force_all));
            if (!fs::is_directory(ictx->resources_root))
            {
                AFORGE_LOG_WARN(&ctx_, "Resource path %s not found, import skipped", ictx->resources_root.string().c_str());
                res.add_result(Guid{}, false, "Resource path not found: " + ictx->resources_root.string());
                prom->set_value(std::move(res));
                return;
            }

            auto futures = std::make_shared<std::vector<std::shared_future<TaskResult>>>();
            try
            {
                assets::FileChangeTracker tracker(ictx->settings.last_imported, force_all);
                const auto summary = importers_.stage(ictx->resources_root, tracker, *ctx_.log_manager);
                AFORGE_LOG_INFO(&ctx_, "Staged %zu of %zu files (%zu changed, %zu without importer)",
                    summary.staged, summary.files, summary.changed, summary.skipped);
            }
            catch (const std::exception& ex)
            {
                AFORGE_LOG_ERROR(&ctx_, "Scanning %s failed: %s", ictx->resources_root.string().c_str(), ex.what());
                res.add_result(Guid{}, false, ex.what());
                prom->set_value(std::move(res));
                return;
            }

            for (auto& importer : importers_.importers())
            {
                try
                {
                    futures->push_back(importer->load_staged_content(false, *ictx));
                }
                catch (const std::exception& ex)
                {
                    AFORGE_LOG_ERROR(&ctx_, "%s failed: %s", importer->name().c_str(), ex.what());
                    res.add_result(Guid{}, false, importer->name() + ": " + ex.what());
                }
            }

            // Yield the strand while the importers pack; collect in a follow-up task
            strand_.post([this, ictx, futures, pass_start, prom, res = std::move(res)]() mutable {
                for (auto& f : *futures)
                {
                    try
                    {
                        res.append(f.get());
                    }
                    catch (const std::exception& ex)
                    {
                        AFORGE_LOG_ERROR(&ctx_, "Import task failed: %s", ex.what());
                        res.add_result(Guid{}, false, ex.what());
                    }
                }

                // Publishing touches GPU state: hand the flush to the main thread
                try
                {
                    res.append(ctx_.main_thread_queue->push_and_wait([this]() { return after_content_loaded(); }));
                }
                catch (const std::exception& ex)
                {
                    AFORGE_LOG_ERROR(&ctx_, "Publishing import results failed: %s", ex.what());
                    res.add_result(Guid{}, false, ex.what());
                }

                set_last_imported(pass_start);
                AFORGE_LOG_INFO(&ctx_, "Import pass done (%zu results, %zu failed)", res.results.size(), res.failure_count());
                prom->set_value(std::move(res));
                });
            });

        return fut;
    }

    TaskResult ResourceImportService::after_content_loaded()
    {
        require_main_thread("after_content_loaded");

        TaskResult res;
        res.type = TaskResult::TaskType::Flush;
        const auto ictx = make_import_context(false);
        for (auto& importer : importers_.importers())
        {
            if (!importer->has_pending())
                continue;
            try
            {
                res.append(importer->flush(ictx));
            }
            catch (const std::exception& ex)
            {
                AFORGE_LOG_ERROR(&ctx_, "%s flush failed: %s", importer->name().c_str(), ex.what());
                res.add_result(Guid{}, false, importer->name() + ": " + ex.what());
            }
        }
        return res;
    }

    TaskResult ResourceImportService::reload_on_window_foreground()
    {
        require_main_thread("reload_on_window_foreground");

        TaskResult res;
        res.type = TaskResult::TaskType::Reload;
        if (strand_.is_busy())
        {
            AFORGE_LOG_INFO(&ctx_, "Import pass in progress, reload skipped");
            return res;
        }

        const auto pass_start = EditorSettings::Clock::now();
        const auto ictx = make_import_context(false);
        if (!fs::is_directory(ictx.resources_root))
        {
            AFORGE_LOG_WARN(&ctx_, "Resource path %s not found, reload skipped", ictx.resources_root.string().c_str());
            res.add_result(Guid{}, false, "Resource path not found: " + ictx.resources_root.string());
            return res;
        }

        try
        {
            assets::FileChangeTracker tracker(ictx.settings.last_imported);
            const auto summary = importers_.stage(ictx.resources_root, tracker, *ctx_.log_manager);
            if (summary.changed == 0)
            {
                AFORGE_LOG_VERBOSE(&ctx_, "No changed resources");
                return res;
            }
        }
        catch (const std::exception& ex)
        {
            AFORGE_LOG_ERROR(&ctx_, "Scanning %s failed: %s", ictx.resources_root.string().c_str(), ex.what());
            res.add_result(Guid{}, false, ex.what());
            return res;
        }

        for (auto& importer : importers_.importers())
        {
            try
            {
                res.append(importer->load_staged_content(true, ictx).get());
            }
            catch (const std::exception& ex)
            {
                AFORGE_LOG_ERROR(&ctx_, "%s reload failed: %s", importer->name().c_str(), ex.what());
                res.add_result(Guid{}, false, importer->name() + ": " + ex.what());
            }
        }

        set_last_imported(pass_start);
        return res;
    }

    std::vector<std::string> ResourceImportService::scan_hires_images() const
    {
        const auto root = fs::absolute(settings().resources_root()) / "hires_images";
        std::vector<std::string> keys;
        if (!fs::is_directory(root))
        {
            AFORGE_LOG_INFO(&ctx_, "No hires_images folder at %s", root.string().c_str());
            return keys;
        }

        for (const auto& entry : fs::recursive_directory_iterator(root))
        {
            if (entry.is_regular_file() && assets::to_lower(entry.path().extension().string()) == ".png")
                keys.push_back(make_entry_key(root, entry.path()));
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    size_t ResourceImportService::build_bin_content_folder() const
    {
        const size_t count = DualPathSerializer::mirror_directory(serializer_.source_root(), serializer_.binary_root());
        AFORGE_LOG_INFO(&ctx_, "Copied %zu files to %s", count, serializer_.binary_root().string().c_str());
        return count;
    }
}
