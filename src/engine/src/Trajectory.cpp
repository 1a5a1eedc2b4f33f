// /////////////////////////////////////////////////////////////////////////////
/// @file Trajectory.cpp
/// @brief Trajectory implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/engine/Trajectory.hpp>
#include <bounce/math/StateHash.hpp>

namespace bounce::engine {

Trajectory::Trajectory(const Config& config,
                       std::vector<physics::Platform> platforms,
                       core::Frame horizon)
    : config_{config}
    , platforms_{std::move(platforms)}
    , horizon_{horizon}
    , scene_{freshScene()}
{}

Scene Trajectory::freshScene() const
{
    Scene scene{config_};
    scene.setPlatforms(platforms_);
    return scene;
}

std::optional<TrajectorySample> Trajectory::next()
{
    if (finished())
        return std::nullopt;

    const StepResult step = scene_.step();
    const auto& ball = scene_.ball();
    return TrajectorySample{
        step.frame,
        ball.position.x, ball.position.y,
        ball.velocity.x, ball.velocity.y,
        step.hitPlatform,
    };
}

void Trajectory::restart()
{
    scene_ = freshScene();
}

core::u64 Trajectory::fingerprint()
{
    restart();
    math::StateHash hash;
    while (auto sample = next())
    {
        const core::u64 hit = sample->hitPlatform ? static_cast<core::u64>(*sample->hitPlatform) + 1 : 0;
        hash.combine(sample->frame, sample->x, sample->y, sample->vx, sample->vy, hit);
    }
    restart();
    return hash.digest();
}

} // namespace bounce::engine
