// Licensed under the MIT License. See LICENSE file for details.

#include "AtlasAssembler.hpp"
#include <algorithm>
#include <cstring>

namespace aforge
{
    std::string make_entry_key(const std::filesystem::path& root, const std::filesystem::path& file)
    {
        auto rel = file.lexically_relative(root);
        if (rel.empty())
            rel = file.filename();
        rel.replace_extension();

        std::string key = rel.generic_string();
        std::replace(key.begin(), key.end(), '\\', '/');
        return key;
    }

    namespace
    {
        void blit(Image& page, const Image& src, const PackPlacement& p)
        {
            if (!p.rotated)
            {
                const size_t row_bytes = static_cast<size_t>(src.width) * Image::channels;
                for (int sy = 0; sy < src.height; sy++)
                    std::memcpy(page.at(p.x, p.y + sy), src.at(0, sy), row_bytes);
                return;
            }

            // 90 degrees clockwise: (sx, sy) -> (x + h - 1 - sy, y + sx)
            for (int sy = 0; sy < src.height; sy++)
                for (int sx = 0; sx < src.width; sx++)
                    std::memcpy(page.at(p.x + src.height - 1 - sy, p.y + sx), src.at(sx, sy), Image::channels);
        }
    }

    AtlasAssembler::AtlasAssembler(const PackOptions& options)
        : packer_(options)
    {
    }

    std::shared_ptr<TextureAtlas> AtlasAssembler::assemble(
        AtlasId id,
        const std::string& name,
        std::vector<SourceImage> images) const
    {
        if (images.empty())
            return nullptr;

        std::vector<PackItem> items;
        items.reserve(images.size());
        for (auto& img : images)
        {
            if (!img.pixels || img.pixels->empty())
                throw AtlasError("Source image '" + img.key + "' has no pixels");
            items.push_back(PackItem{ img.key, img.pixels->width, img.pixels->height });
        }

        const PackResult packed = packer_.pack(items);

        auto atlas = std::make_shared<TextureAtlas>(id, name);
        for (int pi = 0; pi < static_cast<int>(packed.pages.size()); pi++)
        {
            const auto& pp = packed.pages[pi];
            auto page_image = std::make_shared<Image>(pp.width, pp.height);

            for (size_t i = 0; i < images.size(); i++)
            {
                const auto& placement = packed.placements[i];
                if (placement.page != pi)
                    continue;
                blit(*page_image, *images[i].pixels, placement);
                images[i].pixels.reset();
            }

            atlas->add_page(AtlasPage{ atlas_page_path(name, pi), pp.width, pp.height, page_image, nullptr });
        }

        for (size_t i = 0; i < images.size(); i++)
        {
            const auto& p = packed.placements[i];
            atlas->add_entry(images[i].key, AtlasCoordinates{ p.page, p.x, p.y, p.w, p.h, p.rotated });
        }
        return atlas;
    }
}
