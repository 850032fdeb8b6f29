// Licensed under the MIT License. See LICENSE file for details.

#include "FontImporter.hpp"
#include "ThreadPool.hpp"
#include "LogMacros.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace fs = std::filesystem;

namespace aforge::assets
{
    std::map<std::string, FontInfo> font_lookup_from_json(const nlohmann::json& j)
    {
        std::map<std::string, FontInfo> lookup;
        for (const auto& [file, jf] : j.items())
        {
            FontInfo info;
            info.index = jf.at("index").get<int>();
            info.size = jf.at("size").get<int>();
            lookup.emplace(file, info);
        }
        return lookup;
    }

    FontImporter::FontImporter()
        : ResourceImporter("FontImporter", ImporterFilter{ {".ttf"}, FilterType::OnlyTheseFolders, {"fonts"} })
    {
    }

    bool FontImporter::has_changed(const ResourceFile& file, const FileChangeTracker& tracker) const
    {
        return tracker.is_changed(file) || tracker.is_changed(config_path(file.root));
    }

    std::shared_future<TaskResult> FontImporter::load_staged_content(bool reload, const ImportContext& ictx)
    {
        std::vector<StagedFile> files = staged().changed();
        if (files.empty())
        {
            TaskResult res;
            res.type = reload ? TaskResult::TaskType::Reload : TaskResult::TaskType::Import;
            return ready(std::move(res));
        }

        if (reload)
        {
            TaskResult res = convert(files, ictx);
            res.type = TaskResult::TaskType::Reload;
            return ready(std::move(res));
        }

        auto fut = ictx.ctx.thread_pool->queue_task([this, files = std::move(files), ictx]() -> TaskResult
            {
                TaskResult res = convert(files, ictx);
                res.type = TaskResult::TaskType::Import;
                return res;
            });
        return fut.share();
    }

    TaskResult FontImporter::convert(const std::vector<StagedFile>& files, const ImportContext& ictx) const
    {
        auto& ctx = ictx.ctx;
        TaskResult res;

        if (!ctx.external_tool)
        {
            AFORGE_LOG_ERROR(&ctx, "%s: no font tool available, %zu fonts skipped", name().c_str(), files.size());
            res.add_result(Guid{}, false, "No font tool available");
            return res;
        }

        const fs::path lookup_path = config_path(ictx.resources_root);
        std::map<std::string, FontInfo> lookup;
        try
        {
            std::ifstream in(lookup_path);
            if (!in)
                throw std::runtime_error("Failed to open " + lookup_path.string());
            nlohmann::json j;
            in >> j;
            lookup = font_lookup_from_json(j);
        }
        catch (const std::exception& ex)
        {
            AFORGE_LOG_ERROR(&ctx, "%s: %s", name().c_str(), ex.what());
            res.add_result(Guid{}, false, ex.what());
            return res;
        }

        const fs::path out_dir = ictx.settings.packed_root() / "fonts";
        for (const auto& staged : files)
        {
            const auto& ttf = staged.file.path;
            const std::string file_name = ttf.filename().string();
            const Guid guid = Guid::from_name("font:" + file_name);

            auto it = lookup.find(file_name);
            if (it == lookup.end())
            {
                AFORGE_LOG_ERROR(&ctx, "File %s has no matching name in %s. Maybe there's a typo?",
                    ttf.string().c_str(), config_file);
                res.add_result(guid, false, file_name + " missing from " + config_file);
                continue;
            }

            const fs::path out_path = out_dir / ttf.stem();
            const ToolResult tool = ctx.external_tool->run({ ttf.string(), std::to_string(it->second.size), out_path.string() });
            if (!tool.success())
            {
                AFORGE_LOG_ERROR(&ctx, "Converting %s failed (exit code %d): %s",
                    file_name.c_str(), tool.exit_code, tool.diagnostics.c_str());
                res.add_result(guid, false, tool.diagnostics);
                continue;
            }

            AFORGE_LOG_INFO(&ctx, "Converted font %s (size %d)", file_name.c_str(), it->second.size);
            res.add_result(guid, true, file_name);
        }
        return res;
    }
}
