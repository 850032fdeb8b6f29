// Licensed under the MIT License. See LICENSE file for details.

// ILogManager.hpp
#pragma once

namespace aforge
{
    class ILogManager
    {
    public:
        virtual ~ILogManager() = default;

        /// printf-style. Level is carried as a "[INFO] ", "[WARN] " ... prefix
        virtual void log(const char* fmt, ...) = 0;
        virtual void clear() = 0;
    };
}
