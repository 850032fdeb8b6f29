// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IExternalTool.hpp"
#include <string>

namespace aforge
{
    /// Runs an executable through the shell and captures its output
    /// (stdout and stderr) as diagnostics.
    class ProcessExternalTool : public IExternalTool
    {
    public:
        explicit ProcessExternalTool(std::string program);

        ToolResult run(const std::vector<std::string>& args) override;

        const std::string& program() const { return program_; }

        /// Quote one argument for the platform shell
        static std::string quote(const std::string& arg);

    private:
        std::string program_;
    };
}
