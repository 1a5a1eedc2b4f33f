// /////////////////////////////////////////////////////////////////////////////
/// @file Camera.hpp
/// @brief Dead-zone follow camera.
///
/// Rendering-only state: the offset is carried by every scene so an
/// external renderer can draw it, but collision never reads it.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/math/Vec2.hpp>
#include <bounce/core/Constants.hpp>
#include <bounce/core/Types.hpp>

namespace bounce::engine {

/// @brief Keeps the ball inside the central part of the viewport.
class Camera
{
public:
    Camera(core::f64 viewportWidth, core::f64 viewportHeight,
           core::f64 edgeFraction = core::kCameraEdgeFraction) noexcept;

    /// @brief Scrolls just enough to keep @p target out of the edge bands.
    void follow(math::Vec2d target) noexcept;

    void reset() noexcept { offset_ = math::Vec2d::zero(); }

    [[nodiscard]] math::Vec2d offset() const noexcept { return offset_; }

private:
    core::f64 viewportWidth_;
    core::f64 viewportHeight_;
    core::f64 edgeFraction_;
    math::Vec2d offset_{};
};

} // namespace bounce::engine
