// Licensed under the MIT License. See LICENSE file for details.

#include "AtlasSerialization.hpp"
#include "IImageDecoder.hpp"
#include "StbImageCodec.hpp"
#include "LogGlobals.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace aforge::serializers
{
    nlohmann::json atlas_to_json(const TextureAtlas& atlas)
    {
        nlohmann::json j;
        j["id"] = to_string(atlas.id());
        j["name"] = atlas.name();

        nlohmann::json pages = nlohmann::json::array();
        for (const auto& p : atlas.pages())
            pages.push_back({ {"path", p.path}, {"width", p.width}, {"height", p.height} });
        j["pages"] = std::move(pages);

        nlohmann::json entries = nlohmann::json::object();
        for (const auto& [key, c] : atlas.entries())
        {
            entries[key] = {
                {"page", c.page},
                {"x", c.x},
                {"y", c.y},
                {"w", c.w},
                {"h", c.h},
                {"rotated", c.rotated} };
        }
        j["entries"] = std::move(entries);
        return j;
    }

    std::shared_ptr<TextureAtlas> atlas_from_json(const nlohmann::json& j)
    {
        const auto id_str = j.at("id").get<std::string>();
        const auto id = atlas_id_from_string(id_str);
        if (!id)
            throw AtlasError("Unknown atlas id '" + id_str + "'");

        auto atlas = std::make_shared<TextureAtlas>(*id, j.at("name").get<std::string>());

        for (const auto& jp : j.at("pages"))
        {
            AtlasPage page;
            page.path = jp.at("path").get<std::string>();
            page.width = jp.at("width").get<int>();
            page.height = jp.at("height").get<int>();
            atlas->add_page(std::move(page));
        }

        for (const auto& [key, je] : j.at("entries").items())
        {
            AtlasCoordinates c;
            c.page = je.at("page").get<int>();
            c.x = je.at("x").get<int>();
            c.y = je.at("y").get<int>();
            c.w = je.at("w").get<int>();
            c.h = je.at("h").get<int>();
            c.rotated = je.value("rotated", false);
            atlas->add_entry(key, c);
        }
        return atlas;
    }

    SaveStatus serialize_atlas(
        const TextureAtlas& atlas,
        const DualPathSerializer& serializer,
        const AtlasSerializeOptions& options)
    {
        if (!atlas.valid())
            throw AtlasError("Refusing to save atlas '" + atlas.name() + "' without entries");

        std::vector<PendingFile> files;
        for (const auto& p : atlas.pages())
        {
            if (!p.image)
                throw AtlasError("Page " + p.path + " has no pixels to save");
            files.push_back(PendingFile{ p.path, encode_png(*p.image) });
        }
        files.push_back(PendingFile{ atlas_descriptor_path(atlas.name()), DualPathSerializer::json_bytes(atlas_to_json(atlas)) });

        const SaveStatus status = serializer.save_all(files);
        if (status == SaveStatus::SourceWriteFailed)
            return status;

        // Pages from a previous, larger atlas of the same name
        for (int i = atlas.page_count(); serializer.exists(atlas_page_path(atlas.name(), i)); i++)
            serializer.remove(atlas_page_path(atlas.name(), i));

        if (options.delete_temporary)
            serializer.remove_matching("atlas", to_string(AtlasId::Temporary));

        if (options.log)
            LogGlobals::log("[INFO] Saved atlas '%s' (%d pages, %zu entries)",
                atlas.name().c_str(), atlas.page_count(), atlas.entry_count());

        return status;
    }

    std::shared_ptr<TextureAtlas> load_atlas(
        const std::filesystem::path& root,
        const std::string& atlas_name,
        const IImageDecoder& decoder)
    {
        const auto descriptor = root / atlas_descriptor_path(atlas_name);
        if (!std::filesystem::exists(descriptor))
            return nullptr;

        std::ifstream file(descriptor);
        if (!file)
            throw std::runtime_error("Failed to open atlas descriptor: " + descriptor.string());

        nlohmann::json j;
        file >> j;

        auto atlas = atlas_from_json(j);
        for (int i = 0; i < atlas->page_count(); i++)
        {
            auto& page = atlas->page(i);
            auto image = std::make_shared<Image>(decoder.decode(root / page.path));
            if (image->width != page.width || image->height != page.height)
                throw AtlasError("Page " + page.path + " does not match the size in its descriptor");
            page.image = std::move(image);
        }
        return atlas;
    }
}
