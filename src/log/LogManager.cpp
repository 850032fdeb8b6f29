// Licensed under the MIT License. See LICENSE file for details.

#include "LogManager.hpp"
#include <cstdarg>
#include <cstdio>
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <algorithm>

namespace
{
    std::string format_string(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int length = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);
        if (length < 0) return {};

        std::string buffer(length, '\0');
        vsnprintf(buffer.data(), length + 1, fmt, args);
        return buffer;
    }

    std::string current_time_string()
    {
        using namespace std::chrono;

        auto now = system_clock::now();
        auto now_time_t = system_clock::to_time_t(now);
        auto now_ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm;
#if defined(_WIN32)
        localtime_s(&tm, &now_time_t);
#else
        localtime_r(&now_time_t, &tm);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm, "[%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << now_ms.count()
            << ']';

        return oss.str();
    }

    bool starts_with(const std::string& s, const char* prefix)
    {
        return s.rfind(prefix, 0) == 0;
    }
}

namespace aforge
{
    LogManager::LogManager() = default;

    LogManager::~LogManager() = default;

    void LogManager::log(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string msg = format_string(fmt, args);
        va_end(args);

        std::lock_guard lk(mutex_);
        if (!verbose_ && starts_with(msg, "[VERBOSE]"))
            return;

        const std::string line = current_time_string() + " " + msg;
        if (echo_)
        {
            // Warnings and errors go to stderr
            auto& os = (starts_with(msg, "[ERROR]") || starts_with(msg, "[WARN]")) ? std::cerr : std::cout;
            os << line << '\n';
        }
        if (file_.is_open())
        {
            file_ << line << '\n';
            file_.flush();
        }
        lines_.push_back(msg);
    }

    void LogManager::clear()
    {
        std::lock_guard lk(mutex_);
        lines_.clear();
    }

    void LogManager::set_echo(bool enabled)
    {
        std::lock_guard lk(mutex_);
        echo_ = enabled;
    }

    void LogManager::set_verbose(bool enabled)
    {
        std::lock_guard lk(mutex_);
        verbose_ = enabled;
    }

    bool LogManager::open_file(const std::filesystem::path& path)
    {
        std::lock_guard lk(mutex_);
        file_.close();
        file_.open(path, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    std::vector<std::string> LogManager::lines() const
    {
        std::lock_guard lk(mutex_);
        return lines_;
    }

    size_t LogManager::count(const std::string& prefix) const
    {
        std::lock_guard lk(mutex_);
        return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(), [&](const std::string& l)
            {
                return l.rfind(prefix, 0) == 0;
            }));
    }
}
