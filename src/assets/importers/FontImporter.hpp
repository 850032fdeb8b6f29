// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ResourceImporter.hpp"
#include <map>
#include <nlohmann/json_fwd.hpp>

namespace aforge::assets
{
    struct FontInfo
    {
        int index = 0;
        int size = 0;
    };

    /// fonts/fonts.json: { "<file>.ttf": { "index": n, "size": px } }
    std::map<std::string, FontInfo> font_lookup_from_json(const nlohmann::json& j);

    /// Bakes changed .ttf files under fonts/ with the external tool.
    /// Nothing to publish, so flush() has no work.
    class FontImporter : public ResourceImporter
    {
    public:
        static constexpr const char* config_file = "fonts.json";

        FontImporter();

        static std::filesystem::path config_path(const std::filesystem::path& resources_root)
        {
            return resources_root / "fonts" / config_file;
        }

        bool has_changed(const ResourceFile& file, const FileChangeTracker& tracker) const override;
        std::shared_future<TaskResult> load_staged_content(bool reload, const ImportContext& ictx) override;

    private:
        TaskResult convert(const std::vector<StagedFile>& files, const ImportContext& ictx) const;
    };
}
