// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace aforge
{
    enum class SaveStatus { Ok, SourceWriteFailed, BinaryWriteFailed };

    /// One artifact of a multi-file save
    struct PendingFile
    {
        std::filesystem::path relative;
        std::vector<uint8_t> bytes;
    };

    const char* to_string(SaveStatus status);

    /// Writes every artifact to a source tree and a binary tree.
    /// The binary copy is written only after the source copy succeeded;
    /// each copy is written to a temporary file that is then renamed in place.
    class DualPathSerializer
    {
    public:
        DualPathSerializer(std::filesystem::path source_root, std::filesystem::path binary_root);

        const std::filesystem::path& source_root() const { return source_root_; }
        const std::filesystem::path& binary_root() const { return binary_root_; }

        std::filesystem::path source_path(const std::filesystem::path& relative) const;
        std::filesystem::path binary_path(const std::filesystem::path& relative) const;

        SaveStatus save(const std::filesystem::path& relative, const std::vector<uint8_t>& bytes) const;
        SaveStatus save_text(const std::filesystem::path& relative, std::string_view text) const;

        /// Fixed indentation, trailing newline. Same json gives the same bytes.
        SaveStatus save_json(const std::filesystem::path& relative, const nlohmann::json& j) const;

        /// Files that only make sense together (atlas pages and their descriptor).
        /// Every source copy is written before any binary copy, so a failed source
        /// write leaves the binary tree as it was after the last complete save.
        SaveStatus save_all(const std::vector<PendingFile>& files) const;

        /// Same bytes as save_json writes
        static std::vector<uint8_t> json_bytes(const nlohmann::json& j);

        /// True if either copy exists
        bool exists(const std::filesystem::path& relative) const;

        /// Delete both copies. Absent copies are not an error.
        /// Returns false only if an existing file could not be deleted.
        bool remove(const std::filesystem::path& relative) const;

        /// Delete files in `relative_dir` (both trees, non-recursive) whose
        /// name starts with `prefix`. Returns the number of files deleted.
        size_t remove_matching(const std::filesystem::path& relative_dir, std::string_view prefix) const;

        /// Delete the contents of `relative_dir` in both trees, keeping the directory.
        /// Returns the number of entries deleted.
        size_t clear_directory(const std::filesystem::path& relative_dir) const;

        /// Deep copy `from` into `to`, overwriting existing files.
        /// Returns the number of files copied. Throws std::runtime_error on failure.
        static size_t mirror_directory(const std::filesystem::path& from, const std::filesystem::path& to);

    private:
        std::filesystem::path source_root_;
        std::filesystem::path binary_root_;
    };
}
