// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <set>
#include <string>
#include <string_view>

namespace aforge::assets
{
    enum class FilterType { All, OnlyTheseFolders, ExceptTheseFolders, None };

    const char* to_string(FilterType type);

    /// Which files an importer accepts: extension first, then the folder rule.
    /// A folder matches only if it is a member of the set; subfolders are not included.
    struct ImporterFilter
    {
        std::set<std::string> extensions;   // Lowercase, with leading dot
        FilterType type = FilterType::All;
        std::set<std::string> folders;      // Relative to the resource root, '/' separated

        bool accepts_extension(std::string_view extension) const;
        bool accepts_folder(std::string_view folder) const;

        bool accepts(std::string_view extension, std::string_view folder) const
        {
            return accepts_extension(extension) && accepts_folder(folder);
        }
    };

    std::string to_lower(std::string_view str);
}
