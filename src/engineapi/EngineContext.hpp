// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "ILogManager.hpp"
#include "IImageDecoder.hpp"
#include "ITextureUploader.hpp"
#include "IExternalTool.hpp"
#include <memory>
#include <thread>

namespace aforge
{
    class MainThreadQueue;
    class ThreadPool;
    class AssetRegistry;

    /*
    Engine context facilities:
    - Logger
    - Image decoder, texture uploader, external tool (collaborators)
    - Main thread queue
    - Asset registry
    - Thread pool
    */

    struct EngineContext
    {
        /// Must be constructed on the thread that owns the graphics context;
        /// that thread becomes the owner of the main thread queue.
        EngineContext(
            std::shared_ptr<ILogManager>        log_manager,
            std::shared_ptr<IImageDecoder>      image_decoder,
            std::shared_ptr<ITextureUploader>   texture_uploader,
            std::shared_ptr<IExternalTool>      external_tool,
            size_t                              thread_count = std::thread::hardware_concurrency());

        ~EngineContext();

        EngineContext(const EngineContext&) = delete;
        EngineContext& operator=(const EngineContext&) = delete;

        std::shared_ptr<ILogManager>        log_manager;
        std::shared_ptr<IImageDecoder>      image_decoder;
        std::shared_ptr<ITextureUploader>   texture_uploader;
        std::shared_ptr<IExternalTool>      external_tool;
        std::unique_ptr<MainThreadQueue>    main_thread_queue;
        std::unique_ptr<AssetRegistry>      asset_registry;
        // Destroyed first: workers are joined while the other facilities are alive
        std::unique_ptr<ThreadPool>         thread_pool;
    };

    using EngineContextPtr = std::shared_ptr<EngineContext>;

} // namespace aforge
