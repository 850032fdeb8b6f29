// Licensed under the MIT License. See LICENSE file for details.

#include "EngineContext.hpp"

#include "MainThreadQueue.hpp"
#include "ThreadPool.hpp"
#include "AssetRegistry.hpp"
#include "LogGlobals.hpp"
#include <stdexcept>

namespace aforge
{
    EngineContext::EngineContext(
        std::shared_ptr<ILogManager>        log_manager,
        std::shared_ptr<IImageDecoder>      image_decoder,
        std::shared_ptr<ITextureUploader>   texture_uploader,
        std::shared_ptr<IExternalTool>      external_tool,
        size_t                              thread_count)
        : log_manager(std::move(log_manager))
        , image_decoder(std::move(image_decoder))
        , texture_uploader(std::move(texture_uploader))
        , external_tool(std::move(external_tool))
        , main_thread_queue(std::make_unique<MainThreadQueue>())
        , asset_registry(std::make_unique<AssetRegistry>())
        , thread_pool(std::make_unique<ThreadPool>(thread_count))
    {
        if (!this->log_manager)
            throw std::invalid_argument("EngineContext requires a log manager");
        if (!this->image_decoder)
            throw std::invalid_argument("EngineContext requires an image decoder");
        if (!this->texture_uploader)
            throw std::invalid_argument("EngineContext requires a texture uploader");

        LogGlobals::set_logger(this->log_manager);
    }

    EngineContext::~EngineContext()
    {
        // Join workers before anything they may touch goes away
        thread_pool.reset();
    }

} // namespace aforge
