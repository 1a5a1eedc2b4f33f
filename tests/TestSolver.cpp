/**
 * @file TestSolver.cpp
 * @brief Unit tests for bounce::solver::OrientationSolver.
 */

#include <catch2/catch_test_macros.hpp>

#include "bounce/solver/OrientationSolver.hpp"

#include <atomic>
#include <vector>

using namespace bounce;
using namespace bounce::solver;

static engine::Config makeConfig()
{
    auto config = engine::Config::Builder{}
        .arenaSize(200.0, 300.0)
        .ballStart(0.0, 0.0)
        .ballSize(10.0)
        .ballVelocity(5.0, 5.0)
        .build();
    REQUIRE(config.has_value());
    return *config;
}

static SearchOptions alternate()
{
    SearchOptions options;
    options.strategy = Strategy::kAlternate;
    return options;
}

static void requireBouncesOnTargets(const Assignment& assignment)
{
    const auto& platforms = assignment.layout.platforms;
    REQUIRE(platforms.size() == assignment.frames.size());
    REQUIRE(assignment.orientations.size() == assignment.frames.size());
    for (std::size_t i = 0; i < platforms.size(); ++i)
    {
        REQUIRE(platforms[i].expectedBounceFrame() == assignment.frames[i]);
        REQUIRE(platforms[i].isHorizontal() == assignment.orientations[i]);
    }
}

TEST_CASE("Two well spaced frames are solved", "[solver]")
{
    const std::vector<core::Frame> targets{10, 20};
    OrientationSolver solver{makeConfig(), alternate()};

    const auto result = solver.solve(targets);

    REQUIRE(result.has_value());
    REQUIRE(result->orientations == std::vector<bool>{true, false});
    REQUIRE(result->layout.horizon == 20u);
    requireBouncesOnTargets(*result);
    REQUIRE(result->stats.nodesVisited == 2);
    REQUIRE(result->stats.prunedPrefixes == 0);
    REQUIRE(solver.stats().deepestPrefix == 2);

    REQUIRE(result->orientationAt(10) == true);
    REQUIRE(result->orientationAt(20) == false);
    REQUIRE_FALSE(result->orientationAt(15).has_value());
}

TEST_CASE("Default arena solves with full size platforms", "[solver][defaults]")
{
    OrientationSolver solver{engine::Config::defaults(), alternate()};

    SECTION("single frame")
    {
        const auto result = solver.solve(std::vector<core::Frame>{60});
        REQUIRE(result.has_value());
        REQUIRE(result->orientations == std::vector<bool>{true});
        requireBouncesOnTargets(*result);
    }

    SECTION("four frames")
    {
        const std::vector<core::Frame> targets{30, 60, 90, 120};
        const auto result = solver.solve(targets);
        REQUIRE(result.has_value());
        REQUIRE(result->frames == targets);
        REQUIRE(result->orientations == std::vector<bool>{true, false, true, false});
        requireBouncesOnTargets(*result);
    }

    SECTION("five frames")
    {
        const std::vector<core::Frame> targets{20, 40, 60, 80, 100};
        const auto result = solver.solve(targets);
        REQUIRE(result.has_value());
        REQUIRE(result->frames == targets);
        requireBouncesOnTargets(*result);
    }
}

TEST_CASE("Large ball with derived platform size is solved", "[solver][defaults]")
{
    auto config = engine::Config::Builder{}
        .arenaSize(200.0, 300.0)
        .ballStart(0.0, 0.0)
        .ballSize(100.0)
        .ballVelocity(5.0, 5.0)
        .build();
    REQUIRE(config.has_value());
    REQUIRE(config->platformThickness() == 50.0);
    REQUIRE(config->platformLength() == 200.0);

    OrientationSolver solver{*config, alternate()};
    const auto result = solver.solve(std::vector<core::Frame>{10, 20});

    REQUIRE(result.has_value());
    REQUIRE(result->orientations == std::vector<bool>{true, false});
    REQUIRE(result->frames == std::vector<core::Frame>{10, 20});
    requireBouncesOnTargets(*result);
    REQUIRE(result->stats.nodesVisited == 2);
}

TEST_CASE("Alternate strategy honours the initial orientation", "[solver]")
{
    SearchOptions options = alternate();
    options.initialOrientation = false;
    const std::vector<core::Frame> targets{10, 20};

    const auto result = OrientationSolver{makeConfig(), options}.solve(targets);

    REQUIRE(result.has_value());
    REQUIRE(result->orientations.front() == false);
    requireBouncesOnTargets(*result);
}

TEST_CASE("Empty target list yields an empty assignment", "[solver]")
{
    OrientationSolver solver{makeConfig(), SearchOptions{}};

    const auto result = solver.solve({});

    REQUIRE(result.has_value());
    REQUIRE(result->frames.empty());
    REQUIRE(result->orientations.empty());
    REQUIRE(result->layout.platforms.empty());
    REQUIRE(solver.stats().nodesVisited == 0);
}

TEST_CASE("Frames closer than a platform allows exhaust the search", "[solver]")
{
    const std::vector<core::Frame> targets{10, 11, 12};

    for (const Strategy strategy : {Strategy::kAlternate, Strategy::kRandom})
    {
        SearchOptions options;
        options.strategy = strategy;
        options.seed = 3;
        OrientationSolver solver{makeConfig(), options};

        const auto result = solver.solve(targets);

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kNoValidPlacement);
        REQUIRE(solver.stats().nodesVisited == 14);
        REQUIRE(solver.stats().prunedPrefixes == 8);
        REQUIRE(solver.stats().deepestPrefix == 3);
    }
}

TEST_CASE("Longer tracks are solved", "[solver]")
{
    const std::vector<core::Frame> targets{10, 20, 30, 40, 50, 60};

    const auto result = OrientationSolver{makeConfig(), alternate()}.solve(targets);

    REQUIRE(result.has_value());
    requireBouncesOnTargets(*result);
    REQUIRE(engine::Replay::validate(makeConfig(), result->layout, result->frames).has_value());
}

TEST_CASE("Consecutive early frames are solved", "[solver]")
{
    const std::vector<core::Frame> targets{1, 2, 3};

    const auto result = OrientationSolver{makeConfig(), alternate()}.solve(targets);

    REQUIRE(result.has_value());
    REQUIRE(result->orientations == std::vector<bool>{true, false, true});
}

TEST_CASE("Random strategy is reproducible for a seed", "[solver]")
{
    const std::vector<core::Frame> targets{10, 20, 30, 40};
    SearchOptions options;
    options.strategy = Strategy::kRandom;
    options.seed = 42;

    OrientationSolver solver{makeConfig(), options};
    const auto first = solver.solve(targets);
    const auto second = solver.solve(targets);
    const auto fresh = OrientationSolver{makeConfig(), options}.solve(targets);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(fresh.has_value());
    requireBouncesOnTargets(*first);
    REQUIRE(first->orientations == second->orientations);
    REQUIRE(first->orientations == fresh->orientations);
    REQUIRE(first->stats.nodesVisited == fresh->stats.nodesVisited);
}

TEST_CASE("Targets are sorted and deduplicated", "[solver]")
{
    const std::vector<core::Frame> raw{20, 10, 20};

    const auto normalised = normaliseTargets(raw);
    REQUIRE(normalised.has_value());
    REQUIRE(*normalised == std::vector<core::Frame>{10, 20});

    const auto result = OrientationSolver{makeConfig(), alternate()}.solve(raw);
    REQUIRE(result.has_value());
    REQUIRE(result->frames == std::vector<core::Frame>{10, 20});
}

TEST_CASE("Frame zero is rejected", "[solver]")
{
    const std::vector<core::Frame> targets{0, 10};

    const auto result = OrientationSolver{makeConfig(), alternate()}.solve(targets);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Frames past the configured horizon are dropped", "[solver]")
{
    auto config = engine::Config::Builder{}
        .arenaSize(200.0, 300.0)
        .ballStart(0.0, 0.0)
        .ballSize(10.0)
        .ballVelocity(5.0, 5.0)
        .maxFrames(15)
        .build();
    REQUIRE(config.has_value());
    const std::vector<core::Frame> targets{10, 20};

    const auto result = OrientationSolver{*config, alternate()}.solve(targets);

    REQUIRE(result.has_value());
    REQUIRE(result->frames == std::vector<core::Frame>{10});
    REQUIRE(result->layout.platforms.size() == 1);
}

TEST_CASE("A raised cancel flag stops the search", "[solver]")
{
    std::atomic<bool> stop{true};
    SearchOptions options = alternate();
    options.cancel = &stop;
    const std::vector<core::Frame> targets{10, 20};

    OrientationSolver solver{makeConfig(), options};
    const auto result = solver.solve(targets);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kCancelled);
    REQUIRE(solver.stats().nodesVisited == 0);
}

TEST_CASE("Node budget bounds the search", "[solver]")
{
    SearchOptions options = alternate();
    options.maxNodes = 3;
    const std::vector<core::Frame> targets{10, 11, 12};

    OrientationSolver solver{makeConfig(), options};
    const auto result = solver.solve(targets);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kBudgetExhausted);
    REQUIRE(solver.stats().nodesVisited == 3);
}
