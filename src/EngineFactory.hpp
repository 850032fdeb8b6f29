// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "EngineContext.hpp"
#include "EditorSettings.hpp"
#include <memory>

namespace aforge
{
    /// Context for running imports without a window: console/file logging,
    /// stb image decoding, headless texture uploads and the configured font tool.
    /// Call on the thread that will pump the main thread queue.
    EngineContextPtr make_default_context(const EditorSettings& settings);
}
