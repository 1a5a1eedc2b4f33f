// /////////////////////////////////////////////////////////////////////////////
/// @file CarveRegion.hpp
/// @brief Bounding box of the ball's motion within one frame.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/math/Rect.hpp>
#include <bounce/math/Vec2.hpp>
#include <bounce/core/Types.hpp>

namespace bounce::physics {

/// @brief Corner of the start-of-frame box that stays fixed while the ball
///        advances.
enum class Corner : core::u8
{
    kTopLeft,
    kTopRight,
    kBottomLeft,
    kBottomRight
};

/// @brief The corner trailing a ball moving with @p velocity
///        (right+down pins the top-left corner, and so on).
[[nodiscard]] Corner pinnedCornerFor(math::Vec2d velocity) noexcept;

/// @brief The diagonally opposite corner.
[[nodiscard]] Corner opposite(Corner corner) noexcept;

/// @brief Coordinates of @p corner on @p rect.
[[nodiscard]] math::Vec2d cornerOf(const math::Rectd& rect, Corner corner) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class CarveRegion
/// @brief Approximates the swept path of the ball over one frame.
///
/// begin() pins the trailing corner of the start-of-frame box; extend()
/// drags the opposite corner to the matching corner of the end-of-frame box.
/// The region spans the pinned and dragged corners and always covers the
/// start box. After a bounce the end box can fall back behind the pinned
/// corner; that part of it is left out.
// /////////////////////////////////////////////////////////////////////////////
class CarveRegion
{
public:
    void begin(const math::Rectd& ballBox, math::Vec2d velocity) noexcept;
    void extend(const math::Rectd& ballBox) noexcept;
    void clear() noexcept { active_ = false; }

    [[nodiscard]] bool        isActive()     const noexcept { return active_; }
    [[nodiscard]] Corner      pinnedCorner() const noexcept { return corner_; }
    [[nodiscard]] math::Vec2d pinnedPoint()  const noexcept { return cornerOf(start_, corner_); }
    [[nodiscard]] math::Vec2d draggedPoint() const noexcept { return dragged_; }
    [[nodiscard]] math::Rectd rect()         const noexcept;

private:
    math::Rectd start_;
    math::Vec2d dragged_;
    Corner      corner_{Corner::kTopLeft};
    bool        active_{false};
};

} // namespace bounce::physics
