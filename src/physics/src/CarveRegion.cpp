// /////////////////////////////////////////////////////////////////////////////
/// @file CarveRegion.cpp
/// @brief CarveRegion implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/physics/CarveRegion.hpp>

namespace bounce::physics {

Corner pinnedCornerFor(math::Vec2d velocity) noexcept
{
    if (velocity.x > 0.0)
        return (velocity.y > 0.0) ? Corner::kTopLeft : Corner::kBottomLeft;
    return (velocity.y > 0.0) ? Corner::kTopRight : Corner::kBottomRight;
}

Corner opposite(Corner corner) noexcept
{
    switch (corner)
    {
        case Corner::kTopLeft:     return Corner::kBottomRight;
        case Corner::kTopRight:    return Corner::kBottomLeft;
        case Corner::kBottomLeft:  return Corner::kTopRight;
        case Corner::kBottomRight: return Corner::kTopLeft;
    }
    return Corner::kBottomRight;
}

math::Vec2d cornerOf(const math::Rectd& rect, Corner corner) noexcept
{
    switch (corner)
    {
        case Corner::kTopLeft:     return {rect.left(),  rect.top()};
        case Corner::kTopRight:    return {rect.right(), rect.top()};
        case Corner::kBottomLeft:  return {rect.left(),  rect.bottom()};
        case Corner::kBottomRight: return {rect.right(), rect.bottom()};
    }
    return {rect.left(), rect.top()};
}

void CarveRegion::begin(const math::Rectd& ballBox, math::Vec2d velocity) noexcept
{
    start_   = ballBox;
    corner_  = pinnedCornerFor(velocity);
    dragged_ = cornerOf(ballBox, opposite(corner_));
    active_  = true;
}

void CarveRegion::extend(const math::Rectd& ballBox) noexcept
{
    dragged_ = cornerOf(ballBox, opposite(corner_));
}

math::Rectd CarveRegion::rect() const noexcept
{
    return start_.merge(math::Rectd::fromCorners(pinnedPoint(), dragged_));
}

} // namespace bounce::physics
