// /////////////////////////////////////////////////////////////////////////////
/// @file Wall.hpp
/// @brief Destructible wall cell.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/math/Rect.hpp>

namespace bounce::physics {

/// @brief A wall cell. Visible until the ball's swept region touches it.
struct Wall
{
    math::Rectd rect;
    bool        visible{true};

    void carve() noexcept { visible = false; }
};

} // namespace bounce::physics
