// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ILogManager.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace aforge
{
    /// Console + file log sink. Keeps the lines of the session in memory so
    /// that tools (and tests) can inspect what a pass reported.
    class LogManager : public ILogManager
    {
    public:
        LogManager();
        ~LogManager();

        void log(const char* fmt, ...) override;
        void clear() override;

        /// Echo to stdout (on by default)
        void set_echo(bool enabled);

        /// Let "[VERBOSE] " lines through (off by default)
        void set_verbose(bool enabled);

        /// Also append lines to a file. Returns false if the file can't be opened.
        bool open_file(const std::filesystem::path& path);

        std::vector<std::string> lines() const;

        /// Number of kept lines starting with the given level prefix, e.g. "[ERROR]"
        size_t count(const std::string& prefix) const;

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> lines_;
        std::ofstream file_;
        bool echo_ = true;
        bool verbose_ = false;
    };
}
