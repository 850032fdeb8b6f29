// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "Image.hpp"
#include <filesystem>

namespace aforge
{
    class IImageDecoder
    {
    public:
        virtual ~IImageDecoder() = default;

        /// Decode an image file to RGBA8. Throws std::runtime_error on failure.
        virtual Image decode(const std::filesystem::path& path) const = 0;
    };
}
