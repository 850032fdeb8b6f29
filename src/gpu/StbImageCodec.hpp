// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IImageDecoder.hpp"
#include <cstdint>
#include <vector>

namespace aforge
{
    /// File decoder backed by stb_image. Always yields RGBA8.
    class StbImageDecoder : public IImageDecoder
    {
    public:
        Image decode(const std::filesystem::path& path) const override;
    };

    /// Encode RGBA8 pixels as PNG. Output is deterministic for identical input.
    /// Throws std::runtime_error on failure.
    std::vector<uint8_t> encode_png(const Image& image);

    /// Decode PNG (or any stb-supported format) from memory to RGBA8
    Image decode_image_memory(const uint8_t* data, size_t size);
}
