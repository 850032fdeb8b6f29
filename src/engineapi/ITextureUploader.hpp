// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "Image.hpp"
#include <cstdint>

namespace aforge
{
    using TextureHandle = uint64_t;
    constexpr TextureHandle texture_handle_null = 0;

    /// GPU sink for composited atlas pages.
    /// upload() is only called on the thread owning the graphics context.
    /// release() may be called from whichever thread drops the last atlas
    /// snapshot; implementations defer the actual GPU delete if needed.
    class ITextureUploader
    {
    public:
        virtual ~ITextureUploader() = default;

        virtual TextureHandle upload(const Image& page) = 0;
        virtual void release(TextureHandle handle) = 0;
    };
}
