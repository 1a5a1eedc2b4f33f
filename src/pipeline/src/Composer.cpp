// /////////////////////////////////////////////////////////////////////////////
/// @file Composer.cpp
/// @brief Composer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/pipeline/Composer.hpp>
#include <bounce/walls/RectMerge.hpp>
#include <bounce/walls/WallLayout.hpp>
#include <bounce/core/Log.hpp>

#include <string>

namespace bounce::pipeline {

namespace {

constexpr std::string_view kTag = "COMPOSER";

} // namespace

Composer::Composer(const engine::Config& config, const solver::SearchOptions& options)
    : config_{config}
    , options_{options}
{}

core::Expected<Composition> Composer::compose(std::span<const core::Frame> targets)
{
    solver::OrientationSolver solver{config_, options_};
    auto assignment = solver.solve(targets);
    if (!assignment)
    {
        core::Log::warn(kTag, "placement failed: " + assignment.error().message());
        return std::unexpected(std::move(assignment.error()));
    }

    Composition composition;
    composition.assignment = std::move(*assignment);

    const engine::Layout& layout = composition.assignment.layout;
    auto walls = walls::placeWalls(layout.platforms, config_);
    composition.wallsPlaced = walls.size();

    walls = walls::carveWalls(config_, layout, std::move(walls));
    const auto surviving = walls::survivingRects(walls);
    composition.wallsSurviving = surviving.size();
    composition.walls = walls::mergeRects(surviving);

    core::Log::info(kTag, std::to_string(surviving.size()) + " walls merged into "
                          + std::to_string(composition.walls.size()));
    return composition;
}

engine::Trajectory Composer::trajectory(const Composition& composition) const
{
    const engine::Layout& layout = composition.assignment.layout;
    return engine::Trajectory{config_, layout.platforms, layout.horizon};
}

} // namespace bounce::pipeline
