// Licensed under the MIT License. See LICENSE file for details.

#include "EngineFactory.hpp"
#include "LogManager.hpp"
#include "StbImageCodec.hpp"
#include "HeadlessTextureUploader.hpp"
#include "ProcessExternalTool.hpp"

namespace aforge
{
    EngineContextPtr make_default_context(const EditorSettings& settings)
    {
        auto log = std::make_shared<LogManager>();
        log->set_verbose(settings.verbose_log);

        return std::make_shared<EngineContext>(
            log,
            std::make_shared<StbImageDecoder>(),
            std::make_shared<HeadlessTextureUploader>(),
            std::make_shared<ProcessExternalTool>(settings.font_tool));
    }
}
