// /////////////////////////////////////////////////////////////////////////////
/// @file Composer.hpp
/// @brief End-to-end pipeline: target frames in, platforms and carved walls
///        out.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/solver/OrientationSolver.hpp>
#include <bounce/solver/SearchOptions.hpp>
#include <bounce/engine/Config.hpp>
#include <bounce/engine/Trajectory.hpp>
#include <bounce/math/Rect.hpp>
#include <bounce/core/Expected.hpp>
#include <bounce/core/Types.hpp>

#include <span>
#include <vector>

namespace bounce::pipeline {

/// @brief Everything an external renderer needs.
struct Composition
{
    solver::Assignment       assignment;

    /// @brief Visible wall rectangles after carving and merging.
    std::vector<math::Rectd> walls;

    core::usize              wallsPlaced{0};
    core::usize              wallsSurviving{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Composer
/// @brief Solve, then derive, carve and compact the walls.
// /////////////////////////////////////////////////////////////////////////////
class Composer
{
public:
    Composer(const engine::Config& config, const solver::SearchOptions& options);

    /// @brief Runs the whole pipeline.
    /// @return The composition or the solver's error.
    [[nodiscard]] core::Expected<Composition> compose(std::span<const core::Frame> targets);

    /// @brief Restartable ball trajectory over a composition's layout.
    [[nodiscard]] engine::Trajectory trajectory(const Composition& composition) const;

    [[nodiscard]] const engine::Config& config() const noexcept { return config_; }

private:
    engine::Config        config_;
    solver::SearchOptions options_;
};

} // namespace bounce::pipeline
