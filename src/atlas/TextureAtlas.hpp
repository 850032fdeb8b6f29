// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "Image.hpp"
#include "GpuTexture.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace aforge
{
    enum class AtlasId { Gameplay, Editor, Temporary };

    const char* to_string(AtlasId id);
    std::optional<AtlasId> atlas_id_from_string(std::string_view str);

    class AtlasError : public std::runtime_error
    {
    public:
        explicit AtlasError(const std::string& msg) : std::runtime_error(msg) {}
    };

    /// Location of an entry. w/h are the extents on the page;
    /// a rotated entry is stored turned 90 degrees clockwise.
    struct AtlasCoordinates
    {
        int page = 0;
        int x = 0;
        int y = 0;
        int w = 0;
        int h = 0;
        bool rotated = false;

        bool operator==(const AtlasCoordinates&) const = default;
    };

    struct AtlasPage
    {
        std::string path;                       // Relative to the packed root, e.g. atlas/gameplay_0.png
        int width = 0;
        int height = 0;
        std::shared_ptr<const Image> image;     // Composited pixels
        std::shared_ptr<GpuTexture> texture;    // Set once uploaded
    };

    /// "atlas/<name>_<index>.png"
    std::string atlas_page_path(const std::string& atlas_name, int page_index);

    /// "atlas/<name>.json"
    std::string atlas_descriptor_path(const std::string& atlas_name);

    class TextureAtlas
    {
    public:
        using EntryMap = std::map<std::string, AtlasCoordinates>;

        TextureAtlas(AtlasId id, std::string name);

        AtlasId id() const { return id_; }
        const std::string& name() const { return name_; }

        /// An atlas without entries is never published nor persisted
        bool valid() const { return !entries_.empty(); }

        int add_page(AtlasPage page);
        const std::vector<AtlasPage>& pages() const { return pages_; }
        AtlasPage& page(int index);
        const AtlasPage& page(int index) const;
        int page_count() const { return static_cast<int>(pages_.size()); }

        /// Throws AtlasError on duplicate keys or a missing page
        void add_entry(const std::string& key, const AtlasCoordinates& coords);
        const EntryMap& entries() const { return entries_; }
        size_t entry_count() const { return entries_.size(); }
        bool has_entry(const std::string& key) const { return entries_.count(key) > 0; }

        /// nullptr if not found
        const AtlasCoordinates* find(const std::string& key) const;

        /// Throws AtlasError if not found
        const AtlasCoordinates& get(const std::string& key) const;

        /// Upload pages that have pixels but no texture yet. Main thread only.
        void upload_pages(const std::shared_ptr<ITextureUploader>& uploader);

        /// Extract the pixels of one entry, unrotated
        Image extract(const std::string& key) const;

    private:
        AtlasId id_;
        std::string name_;
        std::vector<AtlasPage> pages_;
        EntryMap entries_;
    };

    using TextureAtlasPtr = std::shared_ptr<const TextureAtlas>;

    /// Build the atlas that results from applying a temporary atlas to a live one.
    /// Keys present in the temporary atlas replace the live entries. Live pages keep
    /// their index: temporary pages fill live pages left without entries, then are
    /// appended, and only trailing unused pages are dropped. Page paths are renamed
    /// to the target name. Pixels and uploaded textures are shared, not copied.
    /// Live keys in `superseded` are dropped as well (frames of a sheet that shrank).
    /// Temporary keys in `rejected` are ignored and their live entries kept.
    /// `live` may be null.
    std::shared_ptr<TextureAtlas> merge_atlases(
        const TextureAtlas* live,
        const TextureAtlas& temporary,
        AtlasId target_id,
        const std::string& target_name,
        const std::set<std::string>& superseded = {},
        const std::set<std::string>& rejected = {});
}
