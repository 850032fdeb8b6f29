// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ITextureUploader.hpp"
#include <memory>

namespace aforge
{
    /// Owns one uploaded page texture; released when the last atlas snapshot
    /// referencing it goes away.
    class GpuTexture
    {
    public:
        GpuTexture(std::shared_ptr<ITextureUploader> uploader, TextureHandle handle)
            : uploader_(std::move(uploader))
            , handle_(handle)
        {
        }

        ~GpuTexture()
        {
            if (uploader_ && handle_ != texture_handle_null)
                uploader_->release(handle_);
        }

        GpuTexture(const GpuTexture&) = delete;
        GpuTexture& operator=(const GpuTexture&) = delete;

        TextureHandle handle() const { return handle_; }

        static std::shared_ptr<GpuTexture> upload(std::shared_ptr<ITextureUploader> uploader, const Image& image)
        {
            const TextureHandle h = uploader->upload(image);
            return std::make_shared<GpuTexture>(std::move(uploader), h);
        }

    private:
        std::shared_ptr<ITextureUploader> uploader_;
        TextureHandle handle_ = texture_handle_null;
    };
}
