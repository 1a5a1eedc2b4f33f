// /////////////////////////////////////////////////////////////////////////////
/// @file SearchOptions.hpp
/// @brief Tuning knobs and counters of the orientation search.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/core/Types.hpp>

#include <atomic>
#include <string_view>

namespace bounce::solver {

/// @brief Order in which the two children of a search node are tried.
enum class Strategy : core::u8
{
    kAlternate,  ///< Flip of the previous bit first.
    kRandom,     ///< Coin flip per node, drawn from the seeded generator.
};

[[nodiscard]] constexpr std::string_view toString(Strategy strategy) noexcept
{
    return strategy == Strategy::kAlternate ? "alternate" : "random";
}

/// @brief Search configuration.
struct SearchOptions
{
    Strategy strategy{Strategy::kRandom};

    /// @brief Seed of the generator; the same seed reproduces the same search.
    core::u64 seed{0};

    /// @brief First bit tried by the alternate strategy.
    bool initialOrientation{true};

    /// @brief Polled on every node entry; setting it stops the search.
    const std::atomic<bool>* cancel{nullptr};

    /// @brief Maximum number of nodes to visit, 0 for no limit.
    core::u64 maxNodes{0};
};

/// @brief Counters describing how much of the tree was explored.
struct SearchStats
{
    core::u64   nodesVisited{0};
    core::u64   prunedPrefixes{0};
    core::usize deepestPrefix{0};
};

} // namespace bounce::solver
