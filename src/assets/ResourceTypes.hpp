// Licensed under the MIT License. See LICENSE file for details.

#ifndef ResourceTypes_h
#define ResourceTypes_h
#include "Guid.h"
#include <string>
#include <string_view>
#include <vector>

namespace aforge
{
    struct OperationResult
    {
        Guid guid{};        // Asset GUID, or invalid for pass-level results
        bool success{ true };
        std::string message{};
    };

    // Result of an import task, aggregated over importers and artifacts
    struct TaskResult
    {
        enum class TaskType { None, Import, Reload, Flush };

        TaskType type{ TaskType::None };
        bool success{ true };
        std::vector<OperationResult> results;

        void add_result(const Guid& guid, bool ok, std::string_view msg = {})
        {
            success &= ok;
            results.push_back(OperationResult{ guid, ok, std::string(msg) });
        }

        void append(const TaskResult& other)
        {
            success &= other.success;
            results.insert(results.end(), other.results.begin(), other.results.end());
        }

        size_t failure_count() const
        {
            size_t n = 0;
            for (auto& r : results) if (!r.success) ++n;
            return n;
        }
    };

} // namespace aforge

#endif // ResourceTypes_h
