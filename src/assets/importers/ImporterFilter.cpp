// Licensed under the MIT License. See LICENSE file for details.

#include "ImporterFilter.hpp"
#include <algorithm>
#include <cctype>

namespace aforge::assets
{
    const char* to_string(FilterType type)
    {
        switch (type)
        {
        case FilterType::All: return "All";
        case FilterType::OnlyTheseFolders: return "OnlyTheseFolders";
        case FilterType::ExceptTheseFolders: return "ExceptTheseFolders";
        case FilterType::None: return "None";
        }
        return "Unknown";
    }

    std::string to_lower(std::string_view str)
    {
        std::string out(str);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool ImporterFilter::accepts_extension(std::string_view extension) const
    {
        return extensions.count(to_lower(extension)) > 0;
    }

    bool ImporterFilter::accepts_folder(std::string_view folder) const
    {
        auto in_set = [&] { return folders.count(std::string(folder)) > 0; };

        switch (type)
        {
        case FilterType::All: return true;
        case FilterType::OnlyTheseFolders: return in_set();
        case FilterType::ExceptTheseFolders: return !in_set();
        case FilterType::None: return false;
        }
        return false;
    }
}
