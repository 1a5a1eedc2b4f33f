// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Scene configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the arena, ball and platform parameters shared by every
/// simulation pass.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/physics/Ball.hpp>
#include <bounce/math/Vec2.hpp>
#include <bounce/core/Constants.hpp>
#include <bounce/core/Expected.hpp>
#include <bounce/core/Types.hpp>

#include <optional>

namespace bounce::engine {

/// @brief Immutable scene configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& arenaSize(core::f64 width, core::f64 height) noexcept;
        Builder& ballStart(core::f64 x, core::f64 y) noexcept;
        Builder& ballSize(core::f64 size) noexcept;
        Builder& ballVelocity(core::f64 vx, core::f64 vy) noexcept;

        /// @brief Same speed on both axes, moving right and down.
        Builder& ballSpeed(core::f64 speed) noexcept;

        /// @brief Short side of a platform. Defaults to half the ball size.
        Builder& platformThickness(core::f64 thickness) noexcept;

        /// @brief Long side of a platform. Defaults to twice the ball size.
        Builder& platformLength(core::f64 length) noexcept;

        /// @brief Thickness of the four edge walls, in arena sizes.
        Builder& edgeWallScale(core::f64 scale) noexcept;

        /// @brief Target frames past this frame are dropped before solving.
        Builder& maxFrames(core::Frame frame) noexcept;

        /// @brief Validates the parameters and freezes them.
        /// @return The config, or kInvalidArgument naming the bad parameter.
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        core::f64 arenaWidth_{core::kDefaultArenaWidth};
        core::f64 arenaHeight_{core::kDefaultArenaHeight};
        math::Vec2d ballStart_{core::kDefaultBallStartX, core::kDefaultBallStartY};
        core::f64 ballSize_{core::kDefaultBallSize};
        math::Vec2d ballVelocity_{core::kDefaultBallSpeed, core::kDefaultBallSpeed};
        std::optional<core::f64> platformThickness_;
        std::optional<core::f64> platformLength_;
        core::f64 edgeWallScale_{core::kDefaultEdgeWallScale};
        std::optional<core::Frame> maxFrames_;
    };

    /// @brief Configuration with every default applied.
    [[nodiscard]] static Config defaults();

    [[nodiscard]] core::f64   arenaWidth()        const noexcept { return arenaWidth_; }
    [[nodiscard]] core::f64   arenaHeight()       const noexcept { return arenaHeight_; }
    [[nodiscard]] math::Vec2d ballStart()         const noexcept { return ballStart_; }
    [[nodiscard]] core::f64   ballSize()          const noexcept { return ballSize_; }
    [[nodiscard]] math::Vec2d ballVelocity()      const noexcept { return ballVelocity_; }
    [[nodiscard]] core::f64   platformThickness() const noexcept { return platformThickness_; }
    [[nodiscard]] core::f64   platformLength()    const noexcept { return platformLength_; }
    [[nodiscard]] core::f64   edgeWallScale()     const noexcept { return edgeWallScale_; }
    [[nodiscard]] std::optional<core::Frame> maxFrames() const noexcept { return maxFrames_; }

    /// @brief A fresh ball in its initial state.
    [[nodiscard]] physics::Ball initialBall() const noexcept
    {
        return physics::Ball{ballStart_, ballVelocity_, ballSize_};
    }

private:
    friend class Builder;

    Config() = default;

    core::f64   arenaWidth_{core::kDefaultArenaWidth};
    core::f64   arenaHeight_{core::kDefaultArenaHeight};
    math::Vec2d ballStart_{core::kDefaultBallStartX, core::kDefaultBallStartY};
    core::f64   ballSize_{core::kDefaultBallSize};
    math::Vec2d ballVelocity_{core::kDefaultBallSpeed, core::kDefaultBallSpeed};
    core::f64   platformThickness_{core::kDefaultPlatformThickness};
    core::f64   platformLength_{core::kDefaultPlatformLength};
    core::f64   edgeWallScale_{core::kDefaultEdgeWallScale};
    std::optional<core::Frame> maxFrames_;
};

} // namespace bounce::engine
