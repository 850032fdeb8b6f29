// Licensed under the MIT License. See LICENSE file for details.

#include "StbImageCodec.hpp"
#include "stb_image.h"
#include "stb_image_write.h"
#include <cstring>
#include <stdexcept>
#include <string>

namespace aforge
{
    namespace
    {
        Image take_pixels(unsigned char* data, int w, int h)
        {
            Image img(w, h);
            std::memcpy(img.pixels.data(), data, img.pixels.size());
            stbi_image_free(data);
            return img;
        }

        void append_bytes(void* context, void* data, int size)
        {
            auto* out = static_cast<std::vector<uint8_t>*>(context);
            auto* bytes = static_cast<const uint8_t*>(data);
            out->insert(out->end(), bytes, bytes + size);
        }
    }

    Image StbImageDecoder::decode(const std::filesystem::path& path) const
    {
        int w = 0, h = 0, channels = 0;
        unsigned char* data = stbi_load(path.string().c_str(), &w, &h, &channels, Image::channels);
        if (!data)
        {
            const char* reason = stbi_failure_reason();
            throw std::runtime_error("Could not load image " + path.string() + (reason ? std::string(": ") + reason : std::string()));
        }
        return take_pixels(data, w, h);
    }

    Image decode_image_memory(const uint8_t* bytes, size_t size)
    {
        int w = 0, h = 0, channels = 0;
        unsigned char* data = stbi_load_from_memory(bytes, static_cast<int>(size), &w, &h, &channels, Image::channels);
        if (!data)
            throw std::runtime_error("Could not decode image from memory");
        return take_pixels(data, w, h);
    }

    std::vector<uint8_t> encode_png(const Image& image)
    {
        if (image.empty())
            throw std::runtime_error("Cannot encode an empty image");

        std::vector<uint8_t> out;
        const int ok = stbi_write_png_to_func(
            append_bytes,
            &out,
            image.width,
            image.height,
            Image::channels,
            image.pixels.data(),
            image.width * Image::channels);
        if (!ok)
            throw std::runtime_error("PNG encoding failed");
        return out;
    }
}
