// /////////////////////////////////////////////////////////////////////////////
/// @file Platform.hpp
/// @brief Rigid obstacle the ball bounces off.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/math/Rect.hpp>
#include <bounce/core/Types.hpp>

#include <optional>

namespace bounce::physics {

// /////////////////////////////////////////////////////////////////////////////
/// @class Platform
/// @brief Rectangle + orientation + the frame of its first bounce.
///
/// The geometry never changes after construction. The expected bounce frame
/// is written at most once: the first hit records it and later hits leave it
/// untouched.
// /////////////////////////////////////////////////////////////////////////////
class Platform
{
public:
    Platform(const math::Rectd& rect, bool horizontal) noexcept
        : rect_{rect}, horizontal_{horizontal}
    {}

    [[nodiscard]] const math::Rectd& rect() const noexcept { return rect_; }

    /// @brief True when the long axis is horizontal.
    [[nodiscard]] bool isHorizontal() const noexcept { return horizontal_; }

    [[nodiscard]] std::optional<core::Frame> expectedBounceFrame() const noexcept
    {
        return expectedBounceFrame_;
    }

    void setExpectedBounceFrame(core::Frame frame) noexcept
    {
        if (!expectedBounceFrame_)
            expectedBounceFrame_ = frame;
    }

private:
    math::Rectd rect_;
    bool horizontal_{false};
    std::optional<core::Frame> expectedBounceFrame_;
};

} // namespace bounce::physics
