// Licensed under the MIT License. See LICENSE file for details.

#include "LogGlobals.hpp"
#include <cstdarg>
#include <string>
#include <cstdio>
#include <mutex>

namespace
{
    std::mutex g_logger_mutex;
    std::weak_ptr<aforge::ILogManager> g_logger;

    std::shared_ptr<aforge::ILogManager> lock_logger()
    {
        std::lock_guard lk(g_logger_mutex);
        return g_logger.lock();
    }

    std::string vformat(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);
        if (len < 0) return {};

        std::string result(len + 1, '\0');
        vsnprintf(&result[0], len + 1, fmt, args);
        result.resize(len);
        return result;
    }
}

namespace aforge::LogGlobals
{
    void set_logger(std::weak_ptr<ILogManager> logger)
    {
        std::lock_guard lk(g_logger_mutex);
        g_logger = std::move(logger);
    }

    void log(const char* fmt, ...)
    {
        if (auto logger = lock_logger())
        {
            va_list args;
            va_start(args, fmt);
            std::string msg = vformat(fmt, args);
            va_end(args);
            logger->log("%s", msg.c_str());
        }
    }

    void clear()
    {
        if (auto logger = lock_logger())
        {
            logger->clear();
        }
    }

    ILogManager* try_get()
    {
        if (auto logger = lock_logger())
            return logger.get();
        return nullptr;
    }
}
