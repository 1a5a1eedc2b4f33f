// /////////////////////////////////////////////////////////////////////////////
/// @file Scene.hpp
/// @brief One simulation pass: ball, platforms, walls and frame counter.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/engine/Camera.hpp>
#include <bounce/engine/Config.hpp>
#include <bounce/physics/Ball.hpp>
#include <bounce/physics/CarveRegion.hpp>
#include <bounce/physics/Platform.hpp>
#include <bounce/physics/Wall.hpp>
#include <bounce/core/Types.hpp>

#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace bounce::engine {

/// @brief A platform to spawn right before the given frame is simulated.
struct Spawn
{
    core::Frame frame{0};
    bool        horizontal{false};
};

/// @brief Outcome of a single Scene::step().
struct StepResult
{
    core::Frame                frame{0};
    std::optional<core::usize> hitPlatform;
    core::usize                wallsCarved{0};
};

/// @brief Builds the platform that the ball, one step ahead, will strike.
///
/// On the cross axis the platform's near face sits inside the predicted ball's
/// leading edge by half of min(thickness, |v|), on the side given by the
/// velocity sign, so the ball cannot reach it on any earlier step. Along its
/// long axis it is centred on the predicted ball.
[[nodiscard]] physics::Platform placePlatform(const physics::Ball& ball,
                                              bool horizontal,
                                              core::f64 thickness,
                                              core::f64 length) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class Scene
/// @brief Owns every piece of mutable state of one pass.
///
/// A scene either builds its layout (spawns queued by setSpawns()) or
/// replays a fixed one (setPlatforms()). Scenes never share state: copying
/// platforms in and out is how passes hand layouts to each other.
// /////////////////////////////////////////////////////////////////////////////
class Scene
{
public:
    explicit Scene(const Config& config);

    /// @brief Queues platform spawns. @p spawns must be sorted by frame.
    void setSpawns(std::vector<Spawn> spawns);

    /// @brief Fixes the layout; no platform will be spawned afterwards.
    void setPlatforms(std::vector<physics::Platform> platforms);

    /// @brief Installs wall cells. Carving runs only while the walls are
    ///        not already marked as carved.
    void setWalls(std::vector<physics::Wall> walls, bool alreadyCarved = false);

    /// @brief Advances one frame: spawn, collide, carve, follow.
    StepResult step();

    [[nodiscard]] core::Frame frame() const noexcept { return frame_; }
    [[nodiscard]] const physics::Ball& ball() const noexcept { return ball_; }
    [[nodiscard]] const Camera& camera() const noexcept { return camera_; }
    [[nodiscard]] bool isLayoutFixed() const noexcept { return layoutFixed_; }
    [[nodiscard]] bool isCarving() const noexcept { return !walls_.empty() && !wallsCarved_; }
    [[nodiscard]] const physics::CarveRegion& carveRegion() const noexcept { return carve_; }

    [[nodiscard]] std::span<const physics::Platform> platforms() const noexcept { return platforms_; }
    [[nodiscard]] std::span<const physics::Wall> walls() const noexcept { return walls_; }

    [[nodiscard]] std::vector<physics::Platform> takePlatforms() && { return std::move(platforms_); }
    [[nodiscard]] std::vector<physics::Wall> takeWalls() && { return std::move(walls_); }

private:
    void spawnPending();

    Config                          config_;
    physics::Ball                   ball_;
    Camera                          camera_;
    core::Frame                     frame_{0};

    std::vector<physics::Platform>  platforms_;
    std::vector<Spawn>              spawns_;
    core::usize                     nextSpawn_{0};
    bool                            layoutFixed_{false};

    std::vector<physics::Wall>      walls_;
    bool                            wallsCarved_{false};
    physics::CarveRegion            carve_;
};

} // namespace bounce::engine
