// /////////////////////////////////////////////////////////////////////////////
/// @file OrientationSolver.cpp
/// @brief Explicit-stack depth-first orientation search.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/solver/OrientationSolver.hpp>
#include <bounce/core/Log.hpp>

#include <algorithm>
#include <string>

namespace bounce::solver {

namespace {

constexpr std::string_view kTag = "SOLVER";
constexpr core::usize kProgressWidth = 60;

/// Prefix rendered as "-" (horizontal) and "|" (vertical), tail only.
std::string progressLine(const std::vector<bool>& prefix, core::usize total)
{
    std::string bits;
    bits.reserve(prefix.size());
    for (const bool b : prefix)
        bits.push_back(b ? '-' : '|');

    std::string line = "progress " + std::to_string(prefix.size() * 100 / total) + "% ";
    if (bits.size() > kProgressWidth)
    {
        line += "(" + std::to_string(bits.size() - kProgressWidth) + "):";
        line += bits.substr(bits.size() - kProgressWidth);
    }
    else
    {
        line += bits;
    }
    return line;
}

} // namespace

std::optional<bool> Assignment::orientationAt(core::Frame frame) const
{
    const auto it = std::lower_bound(frames.begin(), frames.end(), frame);
    if (it == frames.end() || *it != frame)
        return std::nullopt;
    return orientations[static_cast<core::usize>(it - frames.begin())];
}

core::Expected<std::vector<core::Frame>> normaliseTargets(
    std::span<const core::Frame> targets,
    std::optional<core::Frame> maxFrames)
{
    std::vector<core::Frame> frames;
    frames.reserve(targets.size());
    for (const core::Frame f : targets)
    {
        if (f == 0)
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "target frame 0 is the initial state and cannot bounce");
        if (maxFrames && f > *maxFrames)
            continue;
        frames.push_back(f);
    }
    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());
    return frames;
}

OrientationSolver::OrientationSolver(const engine::Config& config, const SearchOptions& options)
    : config_{config}
    , options_{options}
    , rng_{options.seed}
{}

bool OrientationSolver::coinFlip()
{
    return (rng_() & 1u) != 0;
}

bool OrientationSolver::seedBit()
{
    if (options_.strategy == Strategy::kRandom)
        return coinFlip();
    return options_.initialOrientation;
}

std::array<bool, 2> OrientationSolver::childOrder(bool last)
{
    if (options_.strategy == Strategy::kAlternate)
        return {!last, last};

    std::array<bool, 2> order{true, false};
    if (coinFlip())
        std::swap(order[0], order[1]);
    return order;
}

core::Expected<Assignment> OrientationSolver::solve(std::span<const core::Frame> targets)
{
    stats_ = SearchStats{};
    rng_.seed(options_.seed);

    auto normalised = normaliseTargets(targets, config_.maxFrames());
    if (!normalised)
        return std::unexpected(std::move(normalised.error()));
    std::vector<core::Frame> frames = std::move(*normalised);

    if (frames.empty())
    {
        core::Log::info(kTag, "no target frames, nothing to place");
        return Assignment{};
    }

    core::Log::info(kTag, "searching placement for " + std::to_string(frames.size())
                          + " platforms (" + std::string(toString(options_.strategy)) + ")");

    const std::span<const core::Frame> allFrames{frames};

    // The seed bit is tried first, its complement only once that subtree is exhausted.
    const bool seed = seedBit();
    std::vector<std::vector<bool>> stack;
    stack.push_back({!seed});
    stack.push_back({seed});

    while (!stack.empty())
    {
        if (options_.cancel && options_.cancel->load(std::memory_order_relaxed))
        {
            core::Log::info(kTag, "search cancelled");
            return core::makeError(core::ErrorCode::kCancelled, "orientation search cancelled");
        }
        if (options_.maxNodes != 0 && stats_.nodesVisited >= options_.maxNodes)
        {
            core::Log::warn(kTag, "search budget exhausted after "
                                  + std::to_string(stats_.nodesVisited) + " nodes");
            return core::makeError(core::ErrorCode::kBudgetExhausted,
                                   "node budget of " + std::to_string(options_.maxNodes) + " exhausted");
        }

        std::vector<bool> prefix = std::move(stack.back());
        stack.pop_back();

        ++stats_.nodesVisited;
        stats_.deepestPrefix = std::max(stats_.deepestPrefix, prefix.size());

        if (core::Log::isEnabled(core::LogLevel::kDebug))
            core::Log::debug(kTag, progressLine(prefix, frames.size()));

        const auto covered = allFrames.first(prefix.size());
        auto replay = engine::Replay::run(config_, covered, prefix);

        if (!replay)
        {
            ++stats_.prunedPrefixes;
            if (core::Log::isEnabled(core::LogLevel::kDebug))
                core::Log::debug(kTag, "pruned at depth " + std::to_string(prefix.size())
                                       + ": " + engine::describe(replay.error()));
            continue;
        }

        if (prefix.size() == frames.size())
        {
            core::Log::info(kTag, "placement found after " + std::to_string(stats_.nodesVisited)
                                  + " nodes (" + std::to_string(stats_.prunedPrefixes) + " pruned)");
            Assignment result;
            result.frames = std::move(frames);
            result.orientations = std::move(prefix);
            result.layout = std::move(*replay);
            result.stats = stats_;
            return result;
        }

        const auto order = childOrder(prefix.back());
        for (auto it = order.rbegin(); it != order.rend(); ++it)
        {
            std::vector<bool> child = prefix;
            child.push_back(*it);
            stack.push_back(std::move(child));
        }
    }

    core::Log::warn(kTag, "no valid placement after " + std::to_string(stats_.nodesVisited) + " nodes");
    return core::makeError(core::ErrorCode::kNoValidPlacement,
                           "every orientation sequence was rejected; "
                           "try another ball size, speed or platform size");
}

} // namespace bounce::solver
