// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ITextureUploader.hpp"
#include <atomic>

namespace aforge
{
    /// Uploader for tools that run without a graphics context.
    /// Hands out unique handles and keeps count of live textures.
    class HeadlessTextureUploader : public ITextureUploader
    {
    public:
        TextureHandle upload(const Image&) override
        {
            live_.fetch_add(1, std::memory_order_relaxed);
            return next_.fetch_add(1, std::memory_order_relaxed);
        }

        void release(TextureHandle) override
        {
            live_.fetch_sub(1, std::memory_order_relaxed);
        }

        int live_textures() const { return live_.load(std::memory_order_relaxed); }

    private:
        std::atomic<TextureHandle> next_{ 1 };
        std::atomic<int> live_{ 0 };
    };
}
