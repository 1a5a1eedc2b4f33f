// /////////////////////////////////////////////////////////////////////////////
/// @file WallLayout.hpp
/// @brief Wall grid derived from a finished platform layout, and the pass
///        that carves the ball's path out of it.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/engine/Config.hpp>
#include <bounce/engine/Replay.hpp>
#include <bounce/physics/Platform.hpp>
#include <bounce/physics/Wall.hpp>
#include <bounce/math/Rect.hpp>
#include <bounce/core/Types.hpp>

#include <span>
#include <vector>

namespace bounce::walls {

/// @brief Cells of the grid cut along every platform edge, row-major by
///        column. Zero-width and zero-height cells are skipped.
[[nodiscard]] std::vector<math::Rectd> gridCells(std::span<const physics::Platform> platforms);

/// @brief The four walls framing @p bounds, each @p thickX wide (left and
///        right) or @p thickY tall (top and bottom).
[[nodiscard]] std::vector<math::Rectd> edgeWalls(const math::Rectd& bounds,
                                                 core::f64 thickX,
                                                 core::f64 thickY);

/// @brief Grid cells plus the four edge walls, all visible.
///
/// Edge walls are edgeWallScale times the arena size thick. An empty
/// layout produces no walls.
[[nodiscard]] std::vector<physics::Wall> placeWalls(std::span<const physics::Platform> platforms,
                                                    const engine::Config& config);

/// @brief Replays @p layout with @p walls active and returns them with the
///        swept cells marked invisible.
[[nodiscard]] std::vector<physics::Wall> carveWalls(const engine::Config& config,
                                                    const engine::Layout& layout,
                                                    std::vector<physics::Wall> walls);

/// @brief Rectangles of the walls still visible.
[[nodiscard]] std::vector<math::Rectd> survivingRects(std::span<const physics::Wall> walls);

} // namespace bounce::walls
