/**
 * @file RectMerge.hpp
 * @brief Exact-edge rectangle compaction.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_WALLS_RECTMERGE_HPP
    #define BOUNCE_WALLS_RECTMERGE_HPP

    #include <bounce/math/Rect.hpp>

    #include <optional>
    #include <vector>

namespace bounce::walls {

/**
 * @brief Merges two rectangles sharing a full edge.
 *
 * Succeeds only for the same x and width with one directly above the other,
 * or the same y and height with one directly beside the other.
 *
 * @return The union, or nothing when the rectangles do not tile exactly.
 */
[[nodiscard]] std::optional<math::Rectd> mergePair(const math::Rectd &a, const math::Rectd &b) noexcept;

/**
 * @brief Repeatedly merges pairs until a full pass merges nothing.
 *
 * The result covers the same area as the input and is a fixed point:
 * merging it again returns it unchanged.
 */
[[nodiscard]] std::vector<math::Rectd> mergeRects(std::vector<math::Rectd> rects);

} // namespace bounce::walls

#endif // BOUNCE_WALLS_RECTMERGE_HPP
