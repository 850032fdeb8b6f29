// Licensed under the MIT License. See LICENSE file for details.

#include "TextureAtlas.hpp"
#include <cstring>

namespace aforge
{
    const char* to_string(AtlasId id)
    {
        switch (id)
        {
        case AtlasId::Gameplay: return "gameplay";
        case AtlasId::Editor: return "editor";
        case AtlasId::Temporary: return "temporary";
        }
        return "unknown";
    }

    std::optional<AtlasId> atlas_id_from_string(std::string_view str)
    {
        if (str == "gameplay") return AtlasId::Gameplay;
        if (str == "editor") return AtlasId::Editor;
        if (str == "temporary") return AtlasId::Temporary;
        return std::nullopt;
    }

    std::string atlas_page_path(const std::string& atlas_name, int page_index)
    {
        return "atlas/" + atlas_name + "_" + std::to_string(page_index) + ".png";
    }

    std::string atlas_descriptor_path(const std::string& atlas_name)
    {
        return "atlas/" + atlas_name + ".json";
    }

    TextureAtlas::TextureAtlas(AtlasId id, std::string name)
        : id_(id)
        , name_(std::move(name))
    {
    }

    int TextureAtlas::add_page(AtlasPage page)
    {
        pages_.push_back(std::move(page));
        return static_cast<int>(pages_.size()) - 1;
    }

    AtlasPage& TextureAtlas::page(int index)
    {
        if (index < 0 || index >= page_count())
            throw AtlasError("Atlas '" + name_ + "' has no page " + std::to_string(index));
        return pages_[index];
    }

    const AtlasPage& TextureAtlas::page(int index) const
    {
        if (index < 0 || index >= page_count())
            throw AtlasError("Atlas '" + name_ + "' has no page " + std::to_string(index));
        return pages_[index];
    }

    void TextureAtlas::add_entry(const std::string& key, const AtlasCoordinates& coords)
    {
        if (coords.page < 0 || coords.page >= page_count())
            throw AtlasError("Entry '" + key + "' references missing page " + std::to_string(coords.page));
        if (!entries_.emplace(key, coords).second)
            throw AtlasError("Duplicate atlas entry '" + key + "' in atlas '" + name_ + "'");
    }

    const AtlasCoordinates* TextureAtlas::find(const std::string& key) const
    {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    const AtlasCoordinates& TextureAtlas::get(const std::string& key) const
    {
        if (auto c = find(key))
            return *c;
        throw AtlasError("Atlas '" + name_ + "' has no entry '" + key + "'");
    }

    void TextureAtlas::upload_pages(const std::shared_ptr<ITextureUploader>& uploader)
    {
        for (auto& p : pages_)
        {
            if (p.texture || !p.image)
                continue;
            p.texture = GpuTexture::upload(uploader, *p.image);
        }
    }

    Image TextureAtlas::extract(const std::string& key) const
    {
        const auto& c = get(key);
        const auto& p = page(c.page);
        if (!p.image)
            throw AtlasError("Page " + std::to_string(c.page) + " of atlas '" + name_ + "' has no pixels");

        const int w = c.rotated ? c.h : c.w;
        const int h = c.rotated ? c.w : c.h;
        Image out(w, h);
        for (int sy = 0; sy < h; sy++)
            for (int sx = 0; sx < w; sx++)
            {
                const int dx = c.rotated ? c.x + (h - 1 - sy) : c.x + sx;
                const int dy = c.rotated ? c.y + sx : c.y + sy;
                std::memcpy(out.at(sx, sy), p.image->at(dx, dy), Image::channels);
            }
        return out;
    }

    std::shared_ptr<TextureAtlas> merge_atlases(
        const TextureAtlas* live,
        const TextureAtlas& temporary,
        AtlasId target_id,
        const std::string& target_name,
        const std::set<std::string>& superseded,
        const std::set<std::string>& rejected)
    {
        // Slots of the merged atlas; live pages keep their index
        std::vector<const AtlasPage*> slots;
        std::map<std::string, AtlasCoordinates> entries;
        std::set<int> referenced;

        if (live)
        {
            for (auto& p : live->pages()) slots.push_back(&p);
            for (auto& [key, c] : live->entries())
            {
                if ((temporary.has_entry(key) && !rejected.count(key)) || superseded.count(key))
                    continue;
                entries.emplace(key, c);
                referenced.insert(c.page);
            }
        }

        std::set<int> temp_used;
        for (auto& [key, c] : temporary.entries())
            if (!rejected.count(key)) temp_used.insert(c.page);

        // Temporary pages go into freed live slots first, lowest index first
        std::map<int, int> temp_slot;
        int next_free = 0;
        for (int t : temp_used)
        {
            while (next_free < static_cast<int>(slots.size()) && referenced.count(next_free))
                next_free++;

            const int slot = next_free;
            if (slot < static_cast<int>(slots.size()))
                slots[slot] = &temporary.page(t);
            else
                slots.push_back(&temporary.page(t));
            temp_slot[t] = slot;
            referenced.insert(slot);
        }

        for (auto& [key, c] : temporary.entries())
        {
            if (rejected.count(key))
                continue;
            AtlasCoordinates moved = c;
            moved.page = temp_slot.at(c.page);
            entries[key] = moved;
        }

        // Trailing unreferenced pages are dropped; a hole before a used page is kept
        while (!slots.empty() && !referenced.count(static_cast<int>(slots.size()) - 1))
            slots.pop_back();

        auto merged = std::make_shared<TextureAtlas>(target_id, target_name);
        for (const AtlasPage* src : slots)
        {
            AtlasPage p = *src;
            p.path = atlas_page_path(target_name, merged->page_count());
            merged->add_page(std::move(p));
        }

        for (auto& [key, c] : entries)
            merged->add_entry(key, c);
        return merged;
    }
}
