// /////////////////////////////////////////////////////////////////////////////
/// @file Trajectory.hpp
/// @brief Lazy, forward-only, restartable sequence of ball samples.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/engine/Config.hpp>
#include <bounce/engine/Scene.hpp>
#include <bounce/physics/Platform.hpp>
#include <bounce/core/Types.hpp>

#include <optional>
#include <vector>

namespace bounce::engine {

/// @brief Ball state after a frame has been simulated.
struct TrajectorySample
{
    core::Frame                frame{0};
    core::f64                  x{0.0};
    core::f64                  y{0.0};
    core::f64                  vx{0.0};
    core::f64                  vy{0.0};
    std::optional<core::usize> hitPlatform;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Trajectory
/// @brief Replays a fixed layout one frame per next() call.
///
/// Samples are produced on demand; restart() re-runs the layout from
/// frame 0 with a fresh ball.
// /////////////////////////////////////////////////////////////////////////////
class Trajectory
{
public:
    Trajectory(const Config& config,
               std::vector<physics::Platform> platforms,
               core::Frame horizon);

    /// @brief Simulates the next frame; empty once the horizon is reached.
    [[nodiscard]] std::optional<TrajectorySample> next();

    void restart();

    [[nodiscard]] core::Frame horizon()  const noexcept { return horizon_; }
    [[nodiscard]] core::Frame position() const noexcept { return scene_.frame(); }
    [[nodiscard]] bool        finished() const noexcept { return scene_.frame() >= horizon_; }

    /// @brief FNV-1a digest of every sample from frame 1 to the horizon.
    ///
    /// Restarts before and after hashing, so the cursor position is lost.
    [[nodiscard]] core::u64 fingerprint();

private:
    [[nodiscard]] Scene freshScene() const;

    Config                          config_;
    std::vector<physics::Platform>  platforms_;
    core::Frame                     horizon_;
    Scene                           scene_;
};

} // namespace bounce::engine
