// /////////////////////////////////////////////////////////////////////////////
/// @file Ball.hpp
/// @brief The simulated point-mass and its square bounding box.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/math/Rect.hpp>
#include <bounce/math/Vec2.hpp>
#include <bounce/core/Types.hpp>

namespace bounce::physics {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Ball
/// @brief Position (top-left of the bounding square), signed velocity and
///        edge length. Velocity components are never zero.
// /////////////////////////////////////////////////////////////////////////////
struct Ball
{
    math::Vec2d position;
    math::Vec2d velocity;
    core::f64   size{0.0};

    [[nodiscard]] constexpr math::Rectd bounds() const noexcept
    {
        return boundsAt(position);
    }

    [[nodiscard]] constexpr math::Rectd boundsAt(math::Vec2d pos) const noexcept
    {
        return math::Rectd{pos.x, pos.y, size, size};
    }

    /// @brief Position after @p frames unobstructed steps.
    [[nodiscard]] constexpr math::Vec2d predictPosition(core::u32 frames = 1) const noexcept
    {
        return position + velocity * static_cast<core::f64>(frames);
    }

    [[nodiscard]] constexpr bool operator==(const Ball&) const = default;
};

} // namespace bounce::physics
