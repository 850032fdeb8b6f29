// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace aforge
{
    /// Tightly packed RGBA8 pixels, row-major, top row first
    struct Image
    {
        static constexpr int channels = 4;

        int width = 0;
        int height = 0;
        std::vector<uint8_t> pixels;

        Image() = default;
        Image(int width, int height)
            : width(width)
            , height(height)
            , pixels(static_cast<std::size_t>(width) * height * channels, 0)
        {
        }

        bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }

        uint8_t* at(int x, int y) { return pixels.data() + (static_cast<std::size_t>(y) * width + x) * channels; }
        const uint8_t* at(int x, int y) const { return pixels.data() + (static_cast<std::size_t>(y) * width + x) * channels; }
    };
}
