// /////////////////////////////////////////////////////////////////////////////
/// @file WallLayout.cpp
/// @brief Wall grid placement and carving pass.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/walls/WallLayout.hpp>
#include <bounce/engine/Scene.hpp>
#include <bounce/core/Log.hpp>

#include <algorithm>
#include <string>

namespace bounce::walls {

namespace {

constexpr std::string_view kTag = "WALLS";

std::vector<core::f64> sortedUnique(std::vector<core::f64> values)
{
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

} // namespace

std::vector<math::Rectd> gridCells(std::span<const physics::Platform> platforms)
{
    std::vector<core::f64> xs;
    std::vector<core::f64> ys;
    xs.reserve(platforms.size() * 2);
    ys.reserve(platforms.size() * 2);
    for (const auto& platform : platforms)
    {
        const math::Rectd& r = platform.rect();
        xs.push_back(r.left());
        xs.push_back(r.right());
        ys.push_back(r.top());
        ys.push_back(r.bottom());
    }
    xs = sortedUnique(std::move(xs));
    ys = sortedUnique(std::move(ys));

    std::vector<math::Rectd> cells;
    if (xs.size() < 2 || ys.size() < 2)
        return cells;

    cells.reserve((xs.size() - 1) * (ys.size() - 1));
    for (core::usize i = 0; i + 1 < xs.size(); ++i)
    {
        for (core::usize j = 0; j + 1 < ys.size(); ++j)
            cells.emplace_back(xs[i], ys[j], xs[i + 1] - xs[i], ys[j + 1] - ys[j]);
    }
    return cells;
}

std::vector<math::Rectd> edgeWalls(const math::Rectd& bounds, core::f64 thickX, core::f64 thickY)
{
    const core::f64 fullWidth  = bounds.width  + 2.0 * thickX;
    const core::f64 fullHeight = bounds.height + 2.0 * thickY;
    const core::f64 outerLeft  = bounds.left() - thickX;
    const core::f64 outerTop   = bounds.top()  - thickY;

    return {
        math::Rectd{outerLeft,      outerTop,        thickX,    fullHeight},
        math::Rectd{bounds.right(), outerTop,        thickX,    fullHeight},
        math::Rectd{outerLeft,      outerTop,        fullWidth, thickY},
        math::Rectd{outerLeft,      bounds.bottom(), fullWidth, thickY},
    };
}

std::vector<physics::Wall> placeWalls(std::span<const physics::Platform> platforms,
                                      const engine::Config& config)
{
    std::vector<physics::Wall> walls;
    const auto cells = gridCells(platforms);
    if (cells.empty())
        return walls;

    math::Rectd bounds = cells.front();
    for (const auto& cell : cells)
        bounds = bounds.merge(cell);

    walls.reserve(cells.size() + 4);
    for (const auto& cell : cells)
        walls.push_back(physics::Wall{cell});
    for (const auto& edge : edgeWalls(bounds,
                                      config.arenaWidth()  * config.edgeWallScale(),
                                      config.arenaHeight() * config.edgeWallScale()))
        walls.push_back(physics::Wall{edge});

    core::Log::info(kTag, "placed " + std::to_string(walls.size()) + " walls ("
                          + std::to_string(cells.size()) + " grid cells)");
    return walls;
}

std::vector<physics::Wall> carveWalls(const engine::Config& config,
                                      const engine::Layout& layout,
                                      std::vector<physics::Wall> walls)
{
    engine::Scene scene{config};
    scene.setPlatforms(layout.platforms);
    scene.setWalls(std::move(walls));

    core::usize carved = 0;
    while (scene.frame() < layout.horizon)
        carved += scene.step().wallsCarved;

    core::Log::info(kTag, "carved " + std::to_string(carved) + " walls over "
                          + std::to_string(layout.horizon) + " frames");
    return std::move(scene).takeWalls();
}

std::vector<math::Rectd> survivingRects(std::span<const physics::Wall> walls)
{
    std::vector<math::Rectd> rects;
    for (const auto& wall : walls)
    {
        if (wall.visible)
            rects.push_back(wall.rect);
    }
    return rects;
}

} // namespace bounce::walls
