// /////////////////////////////////////////////////////////////////////////////
/// @file Scene.cpp
/// @brief Scene stepping and platform placement.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/engine/Scene.hpp>
#include <bounce/physics/CollisionEngine.hpp>
#include <bounce/core/Assert.hpp>

#include <algorithm>
#include <cmath>

namespace bounce::engine {

physics::Platform placePlatform(const physics::Ball& ball,
                                bool horizontal,
                                core::f64 thickness,
                                core::f64 length) noexcept
{
    const math::Vec2d next = ball.predictPosition();
    const core::f64 size = ball.size;

    if (horizontal)
    {
        const core::f64 depth = std::min(thickness, std::abs(ball.velocity.y)) / 2.0;
        const core::f64 y = (ball.velocity.y > 0.0) ? next.y + size - depth
                                                    : next.y + depth - thickness;
        const core::f64 x = next.x + size / 2.0 - length / 2.0;
        return physics::Platform{math::Rectd{x, y, length, thickness}, true};
    }

    const core::f64 depth = std::min(thickness, std::abs(ball.velocity.x)) / 2.0;
    const core::f64 x = (ball.velocity.x > 0.0) ? next.x + size - depth
                                                : next.x + depth - thickness;
    const core::f64 y = next.y + size / 2.0 - length / 2.0;
    return physics::Platform{math::Rectd{x, y, thickness, length}, false};
}

Scene::Scene(const Config& config)
    : config_{config}
    , ball_{config.initialBall()}
    , camera_{config.arenaWidth(), config.arenaHeight()}
{}

void Scene::setSpawns(std::vector<Spawn> spawns)
{
    BOUNCE_ASSERT(!layoutFixed_);
    spawns_ = std::move(spawns);
    nextSpawn_ = 0;
}

void Scene::setPlatforms(std::vector<physics::Platform> platforms)
{
    platforms_ = std::move(platforms);
    spawns_.clear();
    nextSpawn_ = 0;
    layoutFixed_ = true;
}

void Scene::setWalls(std::vector<physics::Wall> walls, bool alreadyCarved)
{
    walls_ = std::move(walls);
    wallsCarved_ = alreadyCarved;
    carve_.clear();
}

void Scene::spawnPending()
{
    while (nextSpawn_ < spawns_.size() && spawns_[nextSpawn_].frame < frame_)
        ++nextSpawn_;

    if (nextSpawn_ < spawns_.size() && spawns_[nextSpawn_].frame == frame_)
    {
        platforms_.push_back(placePlatform(ball_,
                                           spawns_[nextSpawn_].horizontal,
                                           config_.platformThickness(),
                                           config_.platformLength()));
        ++nextSpawn_;
    }
}

StepResult Scene::step()
{
    ++frame_;

    if (!layoutFixed_)
        spawnPending();

    const bool carving = isCarving();
    if (carving)
        carve_.begin(ball_.bounds(), ball_.velocity);

    StepResult result;
    result.frame = frame_;
    result.hitPlatform = physics::CollisionEngine::step(ball_, platforms_, frame_);

    if (carving)
    {
        carve_.extend(ball_.bounds());
        result.wallsCarved = physics::CollisionEngine::carve(carve_.rect(), walls_);
        if (result.hitPlatform)
            result.wallsCarved += physics::CollisionEngine::carveBeneath(platforms_[*result.hitPlatform].rect(), walls_);
    }

    camera_.follow(ball_.position);
    return result;
}

} // namespace bounce::engine
