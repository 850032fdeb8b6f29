// Licensed under the MIT License. See LICENSE file for details.

#include "ResourceImporter.hpp"

namespace aforge::assets
{
    TaskResult ResourceImporter::flush(const ImportContext&)
    {
        TaskResult res;
        res.type = TaskResult::TaskType::Flush;
        return res;
    }

    std::shared_future<TaskResult> ResourceImporter::ready(TaskResult result)
    {
        std::promise<TaskResult> prom;
        prom.set_value(std::move(result));
        return prom.get_future().share();
    }
}
