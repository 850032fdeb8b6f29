// Licensed under the MIT License. See LICENSE file for details.

#include "AssetRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>

namespace aforge
{
    namespace
    {
        bool iequals(std::string_view a, std::string_view b)
        {
            return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
                {
                    return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
                });
        }
    }

    AssetRegistry::SpriteAssetPtr AssetRegistry::try_get(const Guid& guid) const
    {
        std::lock_guard lock(mutex_);
        auto it = sprites_.find(guid);
        return it == sprites_.end() ? nullptr : it->second;
    }

    AssetRegistry::SpriteAssetPtr AssetRegistry::get(const Guid& guid) const
    {
        if (auto asset = try_get(guid))
            return asset;
        throw std::out_of_range("AssetRegistry: no sprite asset " + guid.to_string());
    }

    bool AssetRegistry::contains(const Guid& guid) const
    {
        std::lock_guard lock(mutex_);
        return sprites_.count(guid) > 0;
    }

    void AssetRegistry::add(assets::SpriteAsset asset)
    {
        if (!asset.guid.valid())
            throw std::invalid_argument("AssetRegistry: sprite '" + asset.name + "' has an invalid GUID");

        std::lock_guard lock(mutex_);
        const Guid guid = asset.guid;
        auto [it, inserted] = sprites_.try_emplace(guid, nullptr);
        if (!inserted)
            throw std::invalid_argument("AssetRegistry: sprite " + guid.to_string() + " already present");
        it->second = std::make_shared<const assets::SpriteAsset>(std::move(asset));
    }

    bool AssetRegistry::remove(const Guid& guid)
    {
        std::lock_guard lock(mutex_);
        return sprites_.erase(guid) > 0;
    }

    size_t AssetRegistry::remove_atlas_assets(AtlasId atlas)
    {
        std::lock_guard lock(mutex_);
        return std::erase_if(sprites_, [atlas](const auto& kv)
            {
                return kv.second->atlas == atlas;
            });
    }

    std::vector<Guid> AssetRegistry::find_by_name(std::string_view name) const
    {
        std::lock_guard lock(mutex_);
        std::vector<Guid> result;
        for (const auto& [guid, asset] : sprites_)
            if (iequals(asset->name, name))
                result.push_back(guid);
        std::sort(result.begin(), result.end());
        return result;
    }

    bool AssetRegistry::name_in_use(std::string_view name) const
    {
        return std::any_of(sprites_.begin(), sprites_.end(), [&](const auto& kv)
            {
                return iequals(kv.second->name, name);
            });
    }

    std::string AssetRegistry::next_available_name(const std::string& name, std::string_view pattern) const
    {
        const auto marker = pattern.find("{}");
        if (marker == std::string_view::npos)
            throw std::invalid_argument("Name pattern '" + std::string(pattern) + "' must contain {}");

        const std::string_view prefix = pattern.substr(0, marker);
        const std::string_view suffix = pattern.substr(marker + 2);

        // Split "base<prefix>N<suffix>" into base and N
        std::string base = name;
        int counter = 0;
        if (name.size() > prefix.size() + suffix.size() && name.ends_with(suffix))
        {
            const std::string_view head = std::string_view(name).substr(0, name.size() - suffix.size());
            size_t digits_begin = head.size();
            while (digits_begin > 0 && std::isdigit(static_cast<unsigned char>(head[digits_begin - 1])))
                digits_begin--;

            if (digits_begin < head.size() && head.substr(0, digits_begin).ends_with(prefix))
            {
                int n = 0;
                const auto digits = head.substr(digits_begin);
                if (std::from_chars(digits.data(), digits.data() + digits.size(), n).ec == std::errc{})
                {
                    counter = n;
                    base = std::string(head.substr(0, digits_begin - prefix.size()));
                }
            }
        }

        std::lock_guard lock(mutex_);
        if (!name_in_use(name))
            return name;

        for (;;)
        {
            ++counter;
            std::string candidate = base;
            candidate.append(prefix).append(std::to_string(counter)).append(suffix);
            if (!name_in_use(candidate))
                return candidate;
        }
    }

    std::vector<AssetRegistry::SpriteAssetPtr> AssetRegistry::sprites(AtlasId atlas) const
    {
        std::lock_guard lock(mutex_);
        std::vector<SpriteAssetPtr> result;
        for (const auto& [guid, asset] : sprites_)
            if (asset->atlas == atlas)
                result.push_back(asset);
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) { return a->name < b->name; });
        return result;
    }

    size_t AssetRegistry::sprite_count() const
    {
        std::lock_guard lock(mutex_);
        return sprites_.size();
    }

    TextureAtlasPtr AssetRegistry::get_atlas(AtlasId id) const
    {
        std::lock_guard lock(mutex_);
        auto it = atlases_.find(id);
        return it == atlases_.end() ? nullptr : it->second;
    }

    TextureAtlasPtr AssetRegistry::replace_atlas(AtlasId id, TextureAtlasPtr atlas)
    {
        TextureAtlasPtr previous;
        {
            std::lock_guard lock(mutex_);
            auto& slot = atlases_[id];
            previous = std::move(slot);
            slot = std::move(atlas);
        }
        return previous;
    }

    std::string AssetRegistry::to_string() const
    {
        std::lock_guard lock(mutex_);
        std::ostringstream oss;
        oss << "AssetRegistry: " << sprites_.size() << " sprites\n";
        for (const auto& [id, atlas] : atlases_)
        {
            oss << "  atlas " << aforge::to_string(id) << ": ";
            if (atlas)
                oss << atlas->page_count() << " pages, " << atlas->entry_count() << " entries\n";
            else
                oss << "none\n";
        }
        return oss.str();
    }
}
