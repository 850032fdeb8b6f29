// Licensed under the MIT License. See LICENSE file for details.

#include "EditorSettings.hpp"
#include "LogGlobals.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace aforge
{
    fs::path EditorSettings::resolve(const fs::path& p) const
    {
        if (p.is_absolute() || file_path.empty())
            return p;
        return file_path.parent_path() / p;
    }

    nlohmann::json settings_to_json(const EditorSettings& s)
    {
        using namespace std::chrono;
        nlohmann::json j;
        j["resources_path"] = s.resources_path.generic_string();
        j["source_packed_path"] = s.source_packed_path.generic_string();
        j["bin_resources_path"] = s.bin_resources_path.generic_string();
        j["max_page_size"] = s.pack.max_size;
        j["padding"] = s.pack.padding;
        j["allow_rotation"] = s.pack.allow_rotation;
        j["only_reload_atlas_with_changes"] = s.only_reload_atlas_with_changes;
        j["asset_name_pattern"] = s.asset_name_pattern;
        j["font_tool"] = s.font_tool;
        j["verbose_log"] = s.verbose_log;
        j["last_imported_ms"] = duration_cast<milliseconds>(s.last_imported.time_since_epoch()).count();
        return j;
    }

    void settings_from_json(const nlohmann::json& j, EditorSettings& s)
    {
        using namespace std::chrono;
        s.resources_path = j.value("resources_path", s.resources_path.generic_string());
        s.source_packed_path = j.value("source_packed_path", s.source_packed_path.generic_string());
        s.bin_resources_path = j.value("bin_resources_path", s.bin_resources_path.generic_string());
        s.pack.max_size = j.value("max_page_size", s.pack.max_size);
        s.pack.padding = j.value("padding", s.pack.padding);
        s.pack.allow_rotation = j.value("allow_rotation", s.pack.allow_rotation);
        s.only_reload_atlas_with_changes = j.value("only_reload_atlas_with_changes", s.only_reload_atlas_with_changes);
        s.asset_name_pattern = j.value("asset_name_pattern", s.asset_name_pattern);
        s.font_tool = j.value("font_tool", s.font_tool);
        s.verbose_log = j.value("verbose_log", s.verbose_log);

        const int64_t ms = j.value("last_imported_ms", int64_t{ 0 });
        s.last_imported = EditorSettings::Clock::time_point(duration_cast<EditorSettings::Clock::duration>(milliseconds(ms)));

        if (s.pack.max_size <= 0 || s.pack.padding < 0)
            throw std::runtime_error("Invalid pack settings: max_page_size must be positive and padding non-negative");
        if (s.asset_name_pattern.find("{}") == std::string::npos)
            throw std::runtime_error("asset_name_pattern must contain {}");
    }

    EditorSettings EditorSettings::load_or_create(const fs::path& path)
    {
        EditorSettings settings;
        settings.file_path = path;

        if (!fs::exists(path))
        {
            LogGlobals::log("[WARN] Settings file %s not found, creating defaults", path.string().c_str());
            settings.save();
            return settings;
        }

        std::ifstream file(path);
        if (!file)
            throw std::runtime_error("Failed to open settings file: " + path.string());

        nlohmann::json j;
        file >> j;
        settings_from_json(j, settings);
        return settings;
    }

    void EditorSettings::save() const
    {
        if (file_path.empty())
            throw std::runtime_error("EditorSettings has no file path");

        if (file_path.has_parent_path())
            fs::create_directories(file_path.parent_path());

        std::ofstream out(file_path, std::ios::trunc);
        if (!out)
            throw std::runtime_error("Failed to open settings file for writing: " + file_path.string());
        out << settings_to_json(*this).dump(4) << "\n";
    }
}
