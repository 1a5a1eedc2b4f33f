// /////////////////////////////////////////////////////////////////////////////
/// @file OrientationSolver.hpp
/// @brief Backtracking search over per-frame platform orientations.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/solver/SearchOptions.hpp>
#include <bounce/engine/Config.hpp>
#include <bounce/engine/Replay.hpp>
#include <bounce/core/Expected.hpp>
#include <bounce/core/Types.hpp>

#include <array>
#include <optional>
#include <random>
#include <span>
#include <vector>

namespace bounce::solver {

/// @brief A complete orientation assignment and the layout it produces.
struct Assignment
{
    /// @brief Target frames in ascending order.
    std::vector<core::Frame> frames;

    /// @brief One bit per frame (true = horizontal platform).
    std::vector<bool> orientations;

    /// @brief Validated platforms for the assignment.
    engine::Layout layout;

    SearchStats stats;

    [[nodiscard]] std::optional<bool> orientationAt(core::Frame frame) const;
};

/**
 * @brief Normalises raw target frames: sorts, drops duplicates and frames
 *        past @p maxFrames.
 * @return The ordered frame set, or kInvalidArgument when frame 0 is
 *         requested (frame 0 is the initial state and cannot bounce).
 */
[[nodiscard]] core::Expected<std::vector<core::Frame>> normaliseTargets(
    std::span<const core::Frame> targets,
    std::optional<core::Frame> maxFrames = std::nullopt);

// /////////////////////////////////////////////////////////////////////////////
/// @class OrientationSolver
/// @brief Depth-first search with per-prefix validity pruning.
///
/// Every node re-runs both replay passes over the frames its prefix covers;
/// a failing prefix is discarded together with its whole subtree. The tree is
/// walked with an explicit stack, so the search depth is not limited by the
/// call stack. Worst-case work is exponential in the number of frames.
// /////////////////////////////////////////////////////////////////////////////
class OrientationSolver
{
public:
    OrientationSolver(const engine::Config& config, const SearchOptions& options);

    /**
     * @brief Finds the first assignment, in search order, whose layout
     *        validates end to end.
     * @return The assignment, or one of kNoValidPlacement, kCancelled,
     *         kBudgetExhausted, kInvalidArgument.
     */
    [[nodiscard]] core::Expected<Assignment> solve(std::span<const core::Frame> targets);

    /// @brief Counters of the last solve() call.
    [[nodiscard]] const SearchStats& stats() const noexcept { return stats_; }

private:
    [[nodiscard]] bool coinFlip();
    [[nodiscard]] bool seedBit();
    [[nodiscard]] std::array<bool, 2> childOrder(bool last);

    engine::Config  config_;
    SearchOptions   options_;
    std::mt19937_64 rng_;
    SearchStats     stats_;
};

} // namespace bounce::solver
