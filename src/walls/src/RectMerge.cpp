/**
 * @file RectMerge.cpp
 * @brief Exact-edge rectangle compaction.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#include "bounce/walls/RectMerge.hpp"

#include <deque>

namespace bounce::walls {

std::optional<math::Rectd> mergePair(const math::Rectd &a, const math::Rectd &b) noexcept
{
    if (a.x == b.x && a.width == b.width)
    {
        if (a.bottom() == b.top())
            return math::Rectd{a.x, a.y, a.width, a.height + b.height};
        if (b.bottom() == a.top())
            return math::Rectd{a.x, b.y, a.width, a.height + b.height};
    }
    if (a.y == b.y && a.height == b.height)
    {
        if (a.right() == b.left())
            return math::Rectd{a.x, a.y, a.width + b.width, a.height};
        if (b.right() == a.left())
            return math::Rectd{b.x, a.y, a.width + b.width, a.height};
    }
    return std::nullopt;
}

std::vector<math::Rectd> mergeRects(std::vector<math::Rectd> rects)
{
    bool changed = true;
    while (changed)
    {
        changed = false;
        std::deque<math::Rectd> pending(rects.begin(), rects.end());
        std::vector<math::Rectd> settled;
        settled.reserve(rects.size());

        while (!pending.empty())
        {
            math::Rectd rect = pending.front();
            pending.pop_front();

            bool mergedAny = false;
            for (auto it = pending.begin(); it != pending.end();)
            {
                if (auto merged = mergePair(rect, *it))
                {
                    rect = *merged;
                    it = pending.erase(it);
                    mergedAny = true;
                }
                else
                {
                    ++it;
                }
            }

            if (mergedAny)
            {
                // grown rectangle may now tile with ones already passed over
                pending.push_back(rect);
                changed = true;
            }
            else
            {
                settled.push_back(rect);
            }
        }
        rects = std::move(settled);
    }
    return rects;
}

} // namespace bounce::walls
