// Licensed under the MIT License. See LICENSE file for details.

#include "BinPacker.hpp"
#include <algorithm>
#include <limits>
#include <numeric>

namespace aforge
{
    namespace
    {
        struct Rect
        {
            int x, y, w, h;

            int right() const { return x + w; }
            int bottom() const { return y + h; }
        };

        bool contains(const Rect& outer, const Rect& inner)
        {
            return inner.x >= outer.x && inner.y >= outer.y &&
                inner.right() <= outer.right() && inner.bottom() <= outer.bottom();
        }

        bool intersects(const Rect& a, const Rect& b)
        {
            return a.x < b.right() && b.x < a.right() &&
                a.y < b.bottom() && b.y < a.bottom();
        }

        struct Fit
        {
            int free_index = -1;
            int short_side = std::numeric_limits<int>::max();
            int long_side = std::numeric_limits<int>::max();
            Rect rect{};
            bool rotated = false;

            // Lower short side, then lower long side, then lowest y, then lowest x
            bool better_than(const Fit& other) const
            {
                if (other.free_index < 0) return true;
                if (short_side != other.short_side) return short_side < other.short_side;
                if (long_side != other.long_side) return long_side < other.long_side;
                if (rect.y != other.rect.y) return rect.y < other.rect.y;
                return rect.x < other.rect.x;
            }
        };

        /// Free-rectangle bookkeeping for one page
        class MaxRectsPage
        {
        public:
            MaxRectsPage(int max_size, int padding)
            {
                free_rects_.push_back(Rect{ padding, padding, max_size - padding, max_size - padding });
            }

            // Footprint dimensions (item size plus padding)
            Fit find(int fw, int fh, bool allow_rotation) const
            {
                Fit best;
                for (int i = 0; i < static_cast<int>(free_rects_.size()); i++)
                {
                    const Rect& fr = free_rects_[i];
                    try_fit(best, i, fr, fw, fh, false);
                    if (allow_rotation && fw != fh)
                        try_fit(best, i, fr, fh, fw, true);
                }
                return best;
            }

            void place(const Rect& used)
            {
                std::vector<Rect> next;
                next.reserve(free_rects_.size() + 4);

                for (const auto& fr : free_rects_)
                {
                    if (!intersects(fr, used))
                    {
                        next.push_back(fr);
                        continue;
                    }
                    // Split the free rect into up to four maximal pieces around the used rect
                    if (used.x > fr.x)
                        next.push_back(Rect{ fr.x, fr.y, used.x - fr.x, fr.h });
                    if (used.right() < fr.right())
                        next.push_back(Rect{ used.right(), fr.y, fr.right() - used.right(), fr.h });
                    if (used.y > fr.y)
                        next.push_back(Rect{ fr.x, fr.y, fr.w, used.y - fr.y });
                    if (used.bottom() < fr.bottom())
                        next.push_back(Rect{ fr.x, used.bottom(), fr.w, fr.bottom() - used.bottom() });
                }

                free_rects_ = std::move(next);
                prune();
            }

        private:
            static void try_fit(Fit& best, int index, const Rect& fr, int w, int h, bool rotated)
            {
                if (w > fr.w || h > fr.h)
                    return;

                Fit f;
                f.free_index = index;
                f.short_side = std::min(fr.w - w, fr.h - h);
                f.long_side = std::max(fr.w - w, fr.h - h);
                f.rect = Rect{ fr.x, fr.y, w, h };
                f.rotated = rotated;
                if (f.better_than(best))
                    best = f;
            }

            // Drop free rects contained in another. Of two equal rects the first is kept.
            void prune()
            {
                for (size_t i = 0; i < free_rects_.size(); i++)
                {
                    for (size_t j = i + 1; j < free_rects_.size(); )
                    {
                        if (contains(free_rects_[i], free_rects_[j]))
                        {
                            free_rects_.erase(free_rects_.begin() + j);
                        }
                        else if (contains(free_rects_[j], free_rects_[i]))
                        {
                            free_rects_.erase(free_rects_.begin() + i);
                            --i;
                            break;
                        }
                        else
                            j++;
                    }
                }
            }

            std::vector<Rect> free_rects_;
        };
    }

    int next_power_of_two(int v)
    {
        int p = 1;
        while (p < v) p <<= 1;
        return p;
    }

    BinPacker::BinPacker(const PackOptions& options)
        : options_(options)
    {
        if (options_.max_size <= 0)
            throw PackError("Max page size must be positive");
        if (options_.padding < 0)
            throw PackError("Padding must not be negative");
    }

    PackResult BinPacker::pack(const std::vector<PackItem>& items) const
    {
        const int max_size = options_.max_size;
        const int padding = options_.padding;

        auto fits_page = [&](int w, int h)
            {
                return w + 2 * padding <= max_size && h + 2 * padding <= max_size;
            };

        for (const auto& item : items)
        {
            if (item.width <= 0 || item.height <= 0)
                throw PackError("Entry '" + item.key + "' has an empty size");

            const bool fits = fits_page(item.width, item.height) ||
                (options_.allow_rotation && fits_page(item.height, item.width));
            if (!fits)
                throw PackError("Entry '" + item.key + "' (" + std::to_string(item.width) + "x" + std::to_string(item.height) +
                    ") does not fit a " + std::to_string(max_size) + "x" + std::to_string(max_size) +
                    " page with padding " + std::to_string(padding));
        }

        std::vector<size_t> order(items.size());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b)
            {
                const auto area_a = static_cast<long long>(items[a].width) * items[a].height;
                const auto area_b = static_cast<long long>(items[b].width) * items[b].height;
                if (area_a != area_b) return area_a > area_b;
                if (items[a].height != items[b].height) return items[a].height > items[b].height;
                return a < b;
            });

        PackResult result;
        result.placements.resize(items.size());

        std::vector<size_t> remaining = std::move(order);
        while (!remaining.empty())
        {
            const int page_index = static_cast<int>(result.pages.size());
            MaxRectsPage page(max_size, padding);
            std::vector<size_t> deferred;
            int used_w = 0, used_h = 0;

            for (size_t idx : remaining)
            {
                const auto& item = items[idx];
                const Fit fit = page.find(item.width + padding, item.height + padding, options_.allow_rotation);
                if (fit.free_index < 0)
                {
                    deferred.push_back(idx);
                    continue;
                }
                page.place(fit.rect);

                PackPlacement& p = result.placements[idx];
                p.page = page_index;
                p.x = fit.rect.x;
                p.y = fit.rect.y;
                p.w = fit.rotated ? item.height : item.width;
                p.h = fit.rotated ? item.width : item.height;
                p.rotated = fit.rotated;

                used_w = std::max(used_w, p.x + p.w);
                used_h = std::max(used_h, p.y + p.h);
            }

            if (deferred.size() == remaining.size())
                throw PackError("Packer made no progress on page " + std::to_string(page_index));

            result.pages.push_back(PackPage{
                std::min(next_power_of_two(used_w + padding), max_size),
                std::min(next_power_of_two(used_h + padding), max_size) });
            remaining = std::move(deferred);
        }

        return result;
    }
}
