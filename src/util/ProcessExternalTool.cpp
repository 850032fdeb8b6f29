// Licensed under the MIT License. See LICENSE file for details.

#include "ProcessExternalTool.hpp"
#include <cstdio>
#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace aforge
{
    ProcessExternalTool::ProcessExternalTool(std::string program)
        : program_(std::move(program))
    {
    }

    std::string ProcessExternalTool::quote(const std::string& arg)
    {
#ifdef _WIN32
        std::string out = "\"";
        for (char c : arg)
        {
            if (c == '"') out += '\\';
            out += c;
        }
        return out + "\"";
#else
        std::string out = "'";
        for (char c : arg)
        {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        return out + "'";
#endif
    }

    ToolResult ProcessExternalTool::run(const std::vector<std::string>& args)
    {
        std::string command = quote(program_);
        for (const auto& a : args)
            command += " " + quote(a);
        command += " 2>&1";

#ifdef _WIN32
        FILE* pipe = _popen(command.c_str(), "r");
#else
        FILE* pipe = popen(command.c_str(), "r");
#endif
        if (!pipe)
            return ToolResult{ -1, "Failed to start " + program_ };

        ToolResult result;
        char buffer[256];
        while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
            result.diagnostics += buffer;

#ifdef _WIN32
        result.exit_code = _pclose(pipe);
#else
        const int status = pclose(pipe);
        result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
#endif
        return result;
    }
}
