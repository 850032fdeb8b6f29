// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace aforge::assets
{
    /// A file under the resource root, as seen by one import pass
    struct ResourceFile
    {
        std::filesystem::path path;                 // Absolute
        std::string extension;                      // Lowercase, with leading dot
        std::filesystem::file_time_type last_write_time{};
        std::string folder;                         // Relative to the root, "." for the root itself
        std::filesystem::path root;                 // Absolute resource root the file was found under

        /// Throws std::filesystem::filesystem_error if the file can't be stat'ed
        static ResourceFile from_path(const std::filesystem::path& root, const std::filesystem::path& file);
    };

    struct StagedFile
    {
        ResourceFile file;
        bool changed = false;
    };

    /// Files staged for one importer during one pass
    class StagingBuffer
    {
    public:
        void clear() { files_.clear(); }

        void stage(ResourceFile file, bool changed)
        {
            files_.push_back(StagedFile{ std::move(file), changed });
        }

        const std::vector<StagedFile>& all() const { return files_; }

        std::vector<StagedFile> changed() const
        {
            std::vector<StagedFile> out;
            for (const auto& f : files_)
                if (f.changed) out.push_back(f);
            return out;
        }

        size_t size() const { return files_.size(); }
        bool empty() const { return files_.empty(); }

        size_t changed_count() const
        {
            size_t n = 0;
            for (const auto& f : files_) if (f.changed) ++n;
            return n;
        }

    private:
        std::vector<StagedFile> files_;
    };
}
