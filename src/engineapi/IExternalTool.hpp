// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <string>
#include <vector>

namespace aforge
{
    struct ToolResult
    {
        int exit_code = 0;
        std::string diagnostics;

        bool success() const { return exit_code == 0; }
    };

    /// External converter (font baking, shader compilation ...)
    class IExternalTool
    {
    public:
        virtual ~IExternalTool() = default;

        virtual ToolResult run(const std::vector<std::string>& args) = 0;
    };
}
