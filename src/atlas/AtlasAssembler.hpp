// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "BinPacker.hpp"
#include "TextureAtlas.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace aforge
{
    /// Entry key for a file: path relative to `root`, extension stripped,
    /// '/' separators, case preserved. E.g. <root>/images/hero.png -> "images/hero"
    std::string make_entry_key(const std::filesystem::path& root, const std::filesystem::path& file);

    struct SourceImage
    {
        std::string key;
        std::shared_ptr<Image> pixels;
    };

    /// Packs source images and composites them into atlas pages
    class AtlasAssembler
    {
    public:
        explicit AtlasAssembler(const PackOptions& options);

        /// Returns nullptr if there are no images. Source pixels are released
        /// as pages are composited. Throws PackError or AtlasError.
        std::shared_ptr<TextureAtlas> assemble(
            AtlasId id,
            const std::string& name,
            std::vector<SourceImage> images) const;

    private:
        BinPacker packer_;
    };
}
