// Licensed under the MIT License. See LICENSE file for details.

#include "EngineFactory.hpp"
#include "ResourceImportService.hpp"
#include "MainThreadQueue.hpp"
#include "AssetRegistry.hpp"
#include "LogMacros.h"
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>

namespace
{
    void print_usage()
    {
        std::cout << "Usage: atlasforge-import [settings.json] [--force] [--reload] [--build-bin] [--hires]\n"
            << "  --force      import every file, not only changed ones\n"
            << "  --reload     after the import, run the incremental reload path\n"
            << "  --build-bin  copy the packed tree into the binary tree\n"
            << "  --hires      list hires images\n";
    }
}

int main(int argc, char* argv[])
{
    std::string settings_path = "atlasforge.json";
    bool force = false, reload = false, build_bin = false, hires = false;

    for (int i = 1; i < argc; i++)
    {
        if (!std::strcmp(argv[i], "--force")) force = true;
        else if (!std::strcmp(argv[i], "--reload")) reload = true;
        else if (!std::strcmp(argv[i], "--build-bin")) build_bin = true;
        else if (!std::strcmp(argv[i], "--hires")) hires = true;
        else if (!std::strcmp(argv[i], "--help") || !std::strcmp(argv[i], "-h")) { print_usage(); return 0; }
        else if (argv[i][0] == '-') { std::cerr << "Unknown option " << argv[i] << std::endl; print_usage(); return 2; }
        else settings_path = argv[i];
    }

    aforge::EditorSettings settings;
    try
    {
        settings = aforge::EditorSettings::load_or_create(settings_path);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Bad settings file " << settings_path << ": " << ex.what() << std::endl;
        return 2;
    }

    auto ctx = aforge::make_default_context(settings);
    bool ok = true;
    {
        aforge::ResourceImportService service(*ctx, settings);

        auto fut = service.import_resources_async(force);

        // Stand-in for the editor loop
        while (fut.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready)
        {
            ctx->main_thread_queue->wait_for_work(std::chrono::milliseconds(10));
            ctx->main_thread_queue->execute_all();
        }

        ok &= fut.get().success;

        if (reload)
            ok &= service.reload_on_window_foreground().success;

        if (hires)
        {
            for (const auto& key : service.scan_hires_images())
                std::cout << key << "\n";
        }

        if (build_bin)
        {
            try
            {
                service.build_bin_content_folder();
            }
            catch (const std::exception& ex)
            {
                AFORGE_LOG_ERROR(ctx, "Building bin content failed: %s", ex.what());
                ok = false;
            }
        }

        AFORGE_LOG_INFO(ctx, "%s", ctx->asset_registry->to_string().c_str());
    }

    return ok ? 0 : 1;
}
