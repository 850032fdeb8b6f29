// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ITextureUploader.hpp"
#include "IExternalTool.hpp"
#include "StbImageCodec.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace aforge::mock
{
    /// Records uploads and releases
    class MockTextureUploader : public ITextureUploader
    {
    public:
        TextureHandle upload(const Image&) override
        {
            std::lock_guard lk(mutex_);
            const TextureHandle h = next_++;
            live_.insert(h);
            uploads_++;
            upload_threads_.insert(std::this_thread::get_id());
            return h;
        }

        void release(TextureHandle handle) override
        {
            std::lock_guard lk(mutex_);
            live_.erase(handle);
            releases_++;
        }

        size_t live() const { std::lock_guard lk(mutex_); return live_.size(); }
        size_t uploads() const { std::lock_guard lk(mutex_); return uploads_; }
        size_t releases() const { std::lock_guard lk(mutex_); return releases_; }
        bool is_live(TextureHandle h) const { std::lock_guard lk(mutex_); return live_.count(h) > 0; }
        std::set<std::thread::id> upload_threads() const { std::lock_guard lk(mutex_); return upload_threads_; }

    private:
        mutable std::mutex mutex_;
        TextureHandle next_ = 1;
        std::set<TextureHandle> live_;
        size_t uploads_ = 0;
        size_t releases_ = 0;
        std::set<std::thread::id> upload_threads_;
    };

    /// Records invocations and answers with a fixed result
    class MockExternalTool : public IExternalTool
    {
    public:
        explicit MockExternalTool(ToolResult result = {})
            : result_(std::move(result))
        {
        }

        ToolResult run(const std::vector<std::string>& args) override
        {
            std::lock_guard lk(mutex_);
            calls_.push_back(args);
            return result_;
        }

        std::vector<std::vector<std::string>> calls() const { std::lock_guard lk(mutex_); return calls_; }

    private:
        mutable std::mutex mutex_;
        ToolResult result_;
        std::vector<std::vector<std::string>> calls_;
    };

    /// Unique directory under the system temp dir, removed on destruction
    class TempDirectory
    {
    public:
        TempDirectory()
        {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() /
                ("aforge_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }

        ~TempDirectory()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDirectory(const TempDirectory&) = delete;
        TempDirectory& operator=(const TempDirectory&) = delete;

        const std::filesystem::path& path() const { return path_; }
        std::filesystem::path operator/(const std::filesystem::path& rel) const { return path_ / rel; }

    private:
        std::filesystem::path path_;
    };

    /// Solid-color image
    inline Image make_image(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
    {
        Image img(w, h);
        for (int y = 0; y < h; y++)
            for (int x = 0; x < w; x++)
            {
                auto* p = img.at(x, y);
                p[0] = r; p[1] = g; p[2] = b; p[3] = a;
            }
        return img;
    }

    inline void write_file(const std::filesystem::path& path, const std::string& text)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }

    inline std::string read_file(const std::filesystem::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    inline void write_png(const std::filesystem::path& path, const Image& image)
    {
        std::filesystem::create_directories(path.parent_path());
        const auto bytes = encode_png(image);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    /// Push a file's write time into the future so it counts as changed
    inline void touch_future(const std::filesystem::path& path, std::chrono::seconds ahead = std::chrono::seconds(5))
    {
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() + ahead);
    }
}
