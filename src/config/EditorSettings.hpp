// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "BinPacker.hpp"
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <filesystem>
#include <string>

namespace aforge
{
    /// Editor configuration, persisted as JSON.
    /// Relative paths are resolved against the directory of the settings file.
    struct EditorSettings
    {
        using Clock = std::chrono::system_clock;

        std::filesystem::path resources_path = "resources";         // Raw images, fonts ...
        std::filesystem::path source_packed_path = "packed";        // Source copy of generated artifacts
        std::filesystem::path bin_resources_path = "bin/resources"; // Binary copy

        PackOptions pack{};

        /// Load the previous atlas instead of repacking when nothing changed
        bool only_reload_atlas_with_changes = true;

        /// Appended to names that are already taken, must contain "{}"
        std::string asset_name_pattern = " ({})";

        /// Font baking executable run by the font importer
        std::string font_tool = "fontbake";

        bool verbose_log = false;

        /// Time of the last completed import pass (epoch if never)
        Clock::time_point last_imported{};

        /// Where the settings were loaded from; empty if never saved
        std::filesystem::path file_path;

        std::filesystem::path resolve(const std::filesystem::path& p) const;
        std::filesystem::path resources_root() const { return resolve(resources_path); }
        std::filesystem::path packed_root() const { return resolve(source_packed_path); }
        std::filesystem::path bin_root() const { return resolve(bin_resources_path); }

        /// Load from file, creating it with defaults if it doesn't exist.
        /// Throws std::runtime_error (or nlohmann::json::exception) on a bad file.
        static EditorSettings load_or_create(const std::filesystem::path& path);

        /// Throws std::runtime_error on failure
        void save() const;
    };

    nlohmann::json settings_to_json(const EditorSettings& settings);
    void settings_from_json(const nlohmann::json& j, EditorSettings& settings);
}
