// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "StagingBuffer.hpp"
#include <chrono>
#include <filesystem>

namespace aforge::assets
{
    /// A file is changed if it was written after the last import.
    /// A forced tracker reports every file as changed.
    class FileChangeTracker
    {
    public:
        using Clock = std::chrono::system_clock;

        explicit FileChangeTracker(Clock::time_point last_imported, bool force_all = false)
            : last_imported_(last_imported)
            , force_all_(force_all)
        {
        }

        bool is_changed(const ResourceFile& file) const;

        /// Missing files are not changed
        bool is_changed(const std::filesystem::path& path) const;

        bool forced() const { return force_all_; }
        Clock::time_point last_imported() const { return last_imported_; }

        static Clock::time_point to_system_time(std::filesystem::file_time_type t);

    private:
        bool newer(std::filesystem::file_time_type t) const;

        Clock::time_point last_imported_;
        bool force_all_;
    };
}
