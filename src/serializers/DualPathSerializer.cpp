// Licensed under the MIT License. See LICENSE file for details.

#include "DualPathSerializer.hpp"
#include "LogGlobals.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace aforge
{
    namespace
    {
        /// Write to "<path>.tmp", then rename over <path>. No exceptions.
        bool write_atomic(const fs::path& path, const uint8_t* data, size_t size)
        {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec)
                return false;

            fs::path tmp = path;
            tmp += ".tmp";
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                if (!out)
                    return false;
                out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
                out.flush();
                if (!out)
                {
                    out.close();
                    fs::remove(tmp, ec);
                    return false;
                }
            }

            fs::rename(tmp, path, ec);
            if (ec)
            {
                std::error_code ec2;
                fs::remove(tmp, ec2);
                return false;
            }
            return true;
        }

        size_t remove_prefixed(const fs::path& dir, std::string_view prefix)
        {
            std::error_code ec;
            if (!fs::is_directory(dir, ec))
                return 0;

            std::vector<fs::path> doomed;
            for (const auto& entry : fs::directory_iterator(dir, ec))
            {
                if (!entry.is_regular_file(ec))
                    continue;
                if (entry.path().filename().string().starts_with(prefix))
                    doomed.push_back(entry.path());
            }

            size_t count = 0;
            for (const auto& p : doomed)
            {
                if (fs::remove(p, ec))
                    count++;
                else if (ec)
                    LogGlobals::log("[WARN] Could not delete %s: %s", p.string().c_str(), ec.message().c_str());
            }
            return count;
        }

        size_t clear_dir(const fs::path& dir)
        {
            std::error_code ec;
            if (!fs::is_directory(dir, ec))
                return 0;

            std::vector<fs::path> doomed;
            for (const auto& entry : fs::directory_iterator(dir, ec))
                doomed.push_back(entry.path());

            size_t count = 0;
            for (const auto& p : doomed)
            {
                const auto n = fs::remove_all(p, ec);
                if (ec)
                    LogGlobals::log("[WARN] Could not delete %s: %s", p.string().c_str(), ec.message().c_str());
                else if (n > 0)
                    count++;
            }
            return count;
        }
    }

    const char* to_string(SaveStatus status)
    {
        switch (status)
        {
        case SaveStatus::Ok: return "Ok";
        case SaveStatus::SourceWriteFailed: return "SourceWriteFailed";
        case SaveStatus::BinaryWriteFailed: return "BinaryWriteFailed";
        }
        return "Unknown";
    }

    DualPathSerializer::DualPathSerializer(fs::path source_root, fs::path binary_root)
        : source_root_(std::move(source_root))
        , binary_root_(std::move(binary_root))
    {
    }

    fs::path DualPathSerializer::source_path(const fs::path& relative) const
    {
        return source_root_ / relative;
    }

    fs::path DualPathSerializer::binary_path(const fs::path& relative) const
    {
        return binary_root_ / relative;
    }

    SaveStatus DualPathSerializer::save(const fs::path& relative, const std::vector<uint8_t>& bytes) const
    {
        const auto src = source_path(relative);
        if (!write_atomic(src, bytes.data(), bytes.size()))
        {
            LogGlobals::log("[ERROR] Failed to write %s", src.string().c_str());
            return SaveStatus::SourceWriteFailed;
        }

        const auto bin = binary_path(relative);
        if (!write_atomic(bin, bytes.data(), bytes.size()))
        {
            LogGlobals::log("[ERROR] Failed to write %s (source copy was saved)", bin.string().c_str());
            return SaveStatus::BinaryWriteFailed;
        }
        return SaveStatus::Ok;
    }

    SaveStatus DualPathSerializer::save_text(const fs::path& relative, std::string_view text) const
    {
        return save(relative, std::vector<uint8_t>(text.begin(), text.end()));
    }

    SaveStatus DualPathSerializer::save_json(const fs::path& relative, const nlohmann::json& j) const
    {
        return save(relative, json_bytes(j));
    }

    std::vector<uint8_t> DualPathSerializer::json_bytes(const nlohmann::json& j)
    {
        const std::string text = j.dump(4) + "\n";
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    SaveStatus DualPathSerializer::save_all(const std::vector<PendingFile>& files) const
    {
        for (const auto& f : files)
        {
            const auto src = source_path(f.relative);
            if (!write_atomic(src, f.bytes.data(), f.bytes.size()))
            {
                LogGlobals::log("[ERROR] Failed to write %s, binary copies left untouched", src.string().c_str());
                return SaveStatus::SourceWriteFailed;
            }
        }

        SaveStatus status = SaveStatus::Ok;
        for (const auto& f : files)
        {
            const auto bin = binary_path(f.relative);
            if (!write_atomic(bin, f.bytes.data(), f.bytes.size()))
            {
                LogGlobals::log("[ERROR] Failed to write %s (source copy was saved)", bin.string().c_str());
                status = SaveStatus::BinaryWriteFailed;
            }
        }
        return status;
    }

    bool DualPathSerializer::exists(const fs::path& relative) const
    {
        std::error_code ec;
        return fs::exists(source_path(relative), ec) || fs::exists(binary_path(relative), ec);
    }

    bool DualPathSerializer::remove(const fs::path& relative) const
    {
        bool ok = true;
        for (const auto& p : { source_path(relative), binary_path(relative) })
        {
            std::error_code ec;
            fs::remove(p, ec);
            if (ec)
            {
                LogGlobals::log("[WARN] Could not delete %s: %s", p.string().c_str(), ec.message().c_str());
                ok = false;
            }
        }
        return ok;
    }

    size_t DualPathSerializer::remove_matching(const fs::path& relative_dir, std::string_view prefix) const
    {
        return remove_prefixed(source_path(relative_dir), prefix) +
            remove_prefixed(binary_path(relative_dir), prefix);
    }

    size_t DualPathSerializer::clear_directory(const fs::path& relative_dir) const
    {
        return clear_dir(source_path(relative_dir)) + clear_dir(binary_path(relative_dir));
    }

    size_t DualPathSerializer::mirror_directory(const fs::path& from, const fs::path& to)
    {
        if (!fs::is_directory(from))
            throw std::runtime_error("Cannot mirror missing directory " + from.string());

        fs::create_directories(to);

        size_t count = 0;
        for (const auto& entry : fs::recursive_directory_iterator(from))
        {
            const auto rel = entry.path().lexically_relative(from);
            const auto target = to / rel;
            if (entry.is_directory())
            {
                fs::create_directories(target);
            }
            else if (entry.is_regular_file())
            {
                fs::create_directories(target.parent_path());
                fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
                count++;
            }
        }
        return count;
    }
}
