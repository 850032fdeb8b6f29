// Licensed under the MIT License. See LICENSE file for details.

#include "FileChangeTracker.hpp"
#include "ImporterFilter.hpp"

namespace fs = std::filesystem;

namespace aforge::assets
{
    ResourceFile ResourceFile::from_path(const fs::path& root, const fs::path& file)
    {
        ResourceFile rf;
        rf.path = fs::absolute(file);
        rf.extension = to_lower(file.extension().string());
        rf.last_write_time = fs::last_write_time(file);

        rf.root = fs::absolute(root);
        auto rel = rf.path.parent_path().lexically_relative(rf.root);
        rf.folder = (rel.empty() || rel == ".") ? std::string(".") : rel.generic_string();
        return rf;
    }

    FileChangeTracker::Clock::time_point FileChangeTracker::to_system_time(fs::file_time_type t)
    {
        return std::chrono::time_point_cast<Clock::duration>(std::chrono::file_clock::to_sys(t));
    }

    bool FileChangeTracker::newer(fs::file_time_type t) const
    {
        return force_all_ || to_system_time(t) > last_imported_;
    }

    bool FileChangeTracker::is_changed(const ResourceFile& file) const
    {
        return newer(file.last_write_time);
    }

    bool FileChangeTracker::is_changed(const fs::path& path) const
    {
        std::error_code ec;
        const auto t = fs::last_write_time(path, ec);
        if (ec)
            return false;
        return newer(t);
    }
}
