// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace aforge
{
    /// Raised when an item can never be placed (larger than a page)
    class PackError : public std::runtime_error
    {
    public:
        explicit PackError(const std::string& msg) : std::runtime_error(msg) {}
    };

    struct PackItem
    {
        std::string key;
        int width = 0;
        int height = 0;
    };

    struct PackOptions
    {
        int max_size = 2048;        // Page width and height limit
        int padding = 1;            // Min distance to page edges and between rects
        bool allow_rotation = false;
    };

    /// Placement of one item. w/h are the extents on the page,
    /// i.e. swapped relative to the item when rotated.
    struct PackPlacement
    {
        int page = -1;
        int x = 0;
        int y = 0;
        int w = 0;
        int h = 0;
        bool rotated = false;
    };

    struct PackPage
    {
        int width = 0;
        int height = 0;
    };

    struct PackResult
    {
        std::vector<PackPlacement> placements;  // Same order as the input items
        std::vector<PackPage> pages;
    };

    /// MaxRects packer (Best Short Side Fit). Items are placed in order of
    /// decreasing area, then height, then input index; identical input gives
    /// identical output. Pages are filled one at a time.
    class BinPacker
    {
    public:
        explicit BinPacker(const PackOptions& options);

        /// Throws PackError if an item is too large for a page
        PackResult pack(const std::vector<PackItem>& items) const;

        const PackOptions& options() const { return options_; }

    private:
        PackOptions options_;
    };

    int next_power_of_two(int v);
}
