// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/engine/Config.hpp>

namespace bounce::engine {

Config::Builder& Config::Builder::arenaSize(core::f64 width, core::f64 height) noexcept
{
    arenaWidth_ = width;
    arenaHeight_ = height;
    return *this;
}

Config::Builder& Config::Builder::ballStart(core::f64 x, core::f64 y) noexcept
{
    ballStart_ = {x, y};
    return *this;
}

Config::Builder& Config::Builder::ballSize(core::f64 size) noexcept
{
    ballSize_ = size;
    return *this;
}

Config::Builder& Config::Builder::ballVelocity(core::f64 vx, core::f64 vy) noexcept
{
    ballVelocity_ = {vx, vy};
    return *this;
}

Config::Builder& Config::Builder::ballSpeed(core::f64 speed) noexcept
{
    ballVelocity_ = {speed, speed};
    return *this;
}

Config::Builder& Config::Builder::platformThickness(core::f64 thickness) noexcept
{
    platformThickness_ = thickness;
    return *this;
}

Config::Builder& Config::Builder::platformLength(core::f64 length) noexcept
{
    platformLength_ = length;
    return *this;
}

Config::Builder& Config::Builder::edgeWallScale(core::f64 scale) noexcept
{
    edgeWallScale_ = scale;
    return *this;
}

Config::Builder& Config::Builder::maxFrames(core::Frame frame) noexcept
{
    maxFrames_ = frame;
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    if (!(arenaWidth_ > 0.0) || !(arenaHeight_ > 0.0))
        return core::makeError(core::ErrorCode::kInvalidArgument, "arena size must be positive");
    if (!(ballSize_ > 0.0))
        return core::makeError(core::ErrorCode::kInvalidArgument, "ball size must be positive");
    if (ballVelocity_.x == 0.0 || ballVelocity_.y == 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "ball velocity must be nonzero on both axes");

    const core::f64 thickness = platformThickness_.value_or(ballSize_ / 2.0);
    const core::f64 length    = platformLength_.value_or(ballSize_ * 2.0);
    if (!(thickness > 0.0) || !(length > 0.0))
        return core::makeError(core::ErrorCode::kInvalidArgument, "platform dimensions must be positive");
    if (!(edgeWallScale_ > 0.0))
        return core::makeError(core::ErrorCode::kInvalidArgument, "edge wall scale must be positive");

    Config cfg;
    cfg.arenaWidth_        = arenaWidth_;
    cfg.arenaHeight_       = arenaHeight_;
    cfg.ballStart_         = ballStart_;
    cfg.ballSize_          = ballSize_;
    cfg.ballVelocity_      = ballVelocity_;
    cfg.platformThickness_ = thickness;
    cfg.platformLength_    = length;
    cfg.edgeWallScale_     = edgeWallScale_;
    cfg.maxFrames_         = maxFrames_;
    return cfg;
}

Config Config::defaults()
{
    return Config{};
}

} // namespace bounce::engine
