// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "EngineContext.hpp"

#define AFORGE_LOG(ctx, ...)          (ctx)->log_manager->log(__VA_ARGS__)
#define AFORGE_LOG_VERBOSE(ctx, ...)  (ctx)->log_manager->log("[VERBOSE] " __VA_ARGS__)
#define AFORGE_LOG_INFO(ctx, ...)     (ctx)->log_manager->log("[INFO] " __VA_ARGS__)
#define AFORGE_LOG_WARN(ctx, ...)     (ctx)->log_manager->log("[WARN] " __VA_ARGS__)
#define AFORGE_LOG_ERROR(ctx, ...)    (ctx)->log_manager->log("[ERROR] " __VA_ARGS__)
