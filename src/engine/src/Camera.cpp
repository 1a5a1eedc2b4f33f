// /////////////////////////////////////////////////////////////////////////////
/// @file Camera.cpp
/// @brief Camera implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/engine/Camera.hpp>

namespace bounce::engine {

namespace {

core::f64 followAxis(core::f64 offset, core::f64 target, core::f64 extent, core::f64 edge) noexcept
{
    if (target - offset < edge)
        return target - edge;
    if (target - offset > extent - edge)
        return target - (extent - edge);
    return offset;
}

} // namespace

Camera::Camera(core::f64 viewportWidth, core::f64 viewportHeight, core::f64 edgeFraction) noexcept
    : viewportWidth_{viewportWidth}
    , viewportHeight_{viewportHeight}
    , edgeFraction_{edgeFraction}
{}

void Camera::follow(math::Vec2d target) noexcept
{
    offset_.x = followAxis(offset_.x, target.x, viewportWidth_,  viewportWidth_  * edgeFraction_);
    offset_.y = followAxis(offset_.y, target.y, viewportHeight_, viewportHeight_ * edgeFraction_);
}

} // namespace bounce::engine
