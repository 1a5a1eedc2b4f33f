/**
 * @file TestReplay.cpp
 * @brief Unit tests for bounce::engine::Replay and Trajectory.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bounce/engine/Replay.hpp"
#include "bounce/engine/Trajectory.hpp"

#include <vector>

using namespace bounce;
using namespace bounce::engine;
using math::Rectd;

static Config makeConfig()
{
    auto config = Config::Builder{}
        .arenaSize(200.0, 300.0)
        .ballStart(0.0, 0.0)
        .ballSize(10.0)
        .ballVelocity(5.0, 5.0)
        .build();
    REQUIRE(config.has_value());
    return *config;
}

static const std::vector<core::Frame> kFrames{10, 20};
static const std::vector<bool>        kOrientations{true, false};

TEST_CASE("Construction places one platform per frame", "[engine][replay]")
{
    const Layout layout = Replay::construct(makeConfig(), kFrames, kOrientations);

    REQUIRE(layout.horizon == 20u);
    REQUIRE(layout.platforms.size() == 2);

    REQUIRE(layout.platforms[0].isHorizontal());
    REQUIRE(layout.platforms[0].rect() == Rectd{45.0, 57.5, 20.0, 5.0});
    REQUIRE(layout.platforms[0].expectedBounceFrame() == 10u);

    REQUIRE_FALSE(layout.platforms[1].isHorizontal());
    REQUIRE(layout.platforms[1].rect() == Rectd{107.5, -12.5, 5.0, 20.0});
    REQUIRE(layout.platforms[1].expectedBounceFrame() == 20u);
}

TEST_CASE("Construction of an empty track is empty", "[engine][replay]")
{
    const Layout layout = Replay::construct(makeConfig(), {}, {});

    REQUIRE(layout.platforms.empty());
    REQUIRE(layout.horizon == 0u);
    REQUIRE(Replay::validate(makeConfig(), layout, {}).has_value());
}

TEST_CASE("Validation accepts a constructed layout", "[engine][replay]")
{
    const Config config = makeConfig();
    const Layout layout = Replay::construct(config, kFrames, kOrientations);

    REQUIRE(Replay::validate(config, layout, kFrames).has_value());
    REQUIRE(Replay::run(config, kFrames, kOrientations).has_value());
}

TEST_CASE("Validation leaves the layout untouched", "[engine][replay]")
{
    const Config config = makeConfig();
    const Layout layout = Replay::construct(config, kFrames, kOrientations);
    const Layout copy = layout;

    REQUIRE(Replay::validate(config, layout, kFrames).has_value());
    REQUIRE(Replay::validate(config, layout, kFrames).has_value());

    for (std::size_t i = 0; i < layout.platforms.size(); ++i)
    {
        REQUIRE(layout.platforms[i].rect() == copy.platforms[i].rect());
        REQUIRE(layout.platforms[i].expectedBounceFrame() == copy.platforms[i].expectedBounceFrame());
    }
}

TEST_CASE("Validation reports a missed bounce", "[engine][replay]")
{
    const Layout empty{{}, 10};
    const std::vector<core::Frame> frames{10};

    const auto result = Replay::validate(makeConfig(), empty, frames);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == MismatchKind::kMissedBounce);
    REQUIRE(result.error().frame == 10u);
    REQUIRE_FALSE(describe(result.error()).empty());
}

TEST_CASE("Validation reports a bounce off the target frames", "[engine][replay]")
{
    const Config config = makeConfig();
    const Layout layout = Replay::construct(config, kFrames, kOrientations);
    const std::vector<core::Frame> onlyFirst{10};

    const auto result = Replay::validate(config, layout, onlyFirst);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == BounceMismatch{MismatchKind::kMistimedBounce, 20, 20u});
}

TEST_CASE("Validation reports a hit on a platform with no expectation", "[engine][replay]")
{
    const Layout layout{{physics::Platform{Rectd{45.0, 57.5, 20.0, 5.0}, true}}, 10};
    const std::vector<core::Frame> frames{10};

    const auto result = Replay::validate(makeConfig(), layout, frames);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == MismatchKind::kMistimedBounce);
    REQUIRE_FALSE(result.error().expected.has_value());
}

TEST_CASE("Crowded frames are rejected as mistimed", "[engine][replay]")
{
    const std::vector<core::Frame> frames{10, 11, 12};
    const std::vector<bool> orientations{true, true, true};

    const auto result = Replay::run(makeConfig(), frames, orientations);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == BounceMismatch{MismatchKind::kMistimedBounce, 12, 10u});
}

TEST_CASE("Trajectory is produced lazily", "[engine][trajectory]")
{
    const Config config = makeConfig();
    const Layout layout = Replay::construct(config, kFrames, kOrientations);
    Trajectory trajectory{config, layout.platforms, layout.horizon};

    REQUIRE(trajectory.position() == 0u);

    const auto first = trajectory.next();
    REQUIRE(first.has_value());
    REQUIRE(first->frame == 1u);
    REQUIRE(first->x == 5.0);
    REQUIRE(first->y == 5.0);
    REQUIRE(trajectory.position() == 1u);

    std::vector<core::Frame> hits;
    std::optional<TrajectorySample> last;
    while (auto sample = trajectory.next())
    {
        if (sample->hitPlatform)
            hits.push_back(sample->frame);
        last = sample;
    }

    REQUIRE(trajectory.finished());
    REQUIRE_FALSE(trajectory.next().has_value());
    REQUIRE(hits == kFrames);

    REQUIRE(last->frame == 20u);
    REQUIRE(last->hitPlatform == 1u);
    REQUIRE_THAT(last->x, Catch::Matchers::WithinAbs(92.5, 1e-9));
    REQUIRE_THAT(last->y, Catch::Matchers::WithinAbs(-7.5, 1e-9));
    REQUIRE(last->vx == -5.0);
    REQUIRE(last->vy == -5.0);
}

TEST_CASE("Trajectory restarts from frame zero", "[engine][trajectory]")
{
    const Config config = makeConfig();
    const Layout layout = Replay::construct(config, kFrames, kOrientations);
    Trajectory trajectory{config, layout.platforms, layout.horizon};

    for (int i = 0; i < 5; ++i)
        (void)trajectory.next();
    REQUIRE(trajectory.position() == 5u);

    trajectory.restart();

    REQUIRE(trajectory.position() == 0u);
    REQUIRE(trajectory.next()->frame == 1u);
}

TEST_CASE("Replays of the same layout are bit-identical", "[engine][trajectory]")
{
    const Config config = makeConfig();
    const Layout layout = Replay::construct(config, kFrames, kOrientations);

    Trajectory a{config, layout.platforms, layout.horizon};
    Trajectory b{config, layout.platforms, layout.horizon};

    const auto fingerprint = a.fingerprint();
    REQUIRE(fingerprint == b.fingerprint());
    REQUIRE(fingerprint == a.fingerprint());
    REQUIRE(a.position() == 0u);

    const Layout other = Replay::construct(config, kFrames, std::vector<bool>{true, true});
    Trajectory c{config, other.platforms, other.horizon};
    REQUIRE(c.fingerprint() != fingerprint);
}
