// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief bounce_solve entry-point.
///
/// Reads whitespace-separated target frames from stdin, solves the platform
/// layout with the default scene, and prints platforms and carved walls as
/// plain text on stdout. Ctrl-C stops a long search cleanly.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/pipeline/Composer.hpp>
#include <bounce/engine/Config.hpp>
#include <bounce/core/Log.hpp>
#include <bounce/core/Types.hpp>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::atomic<bool> gStop{false};

extern "C" void onInterrupt(int /*signal*/)
{
    gStop.store(true, std::memory_order_relaxed);
}

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    std::vector<bounce::core::Frame> targets;
    bounce::core::Frame frame = 0;
    while (std::cin >> frame)
        targets.push_back(frame);
    if (!std::cin.eof())
    {
        bounce::core::Log::error("expected non-negative integer frames on stdin");
        return 2;
    }

    std::signal(SIGINT, onInterrupt);

    auto config = bounce::engine::Config::Builder{}.build();
    if (!config)
    {
        bounce::core::Log::error(config.error().message());
        return 2;
    }

    bounce::solver::SearchOptions options;
    options.strategy = bounce::solver::Strategy::kRandom;
    options.seed = 1;
    options.cancel = &gStop;

    bounce::pipeline::Composer composer{*config, options};
    auto composition = composer.compose(targets);
    if (!composition)
    {
        const auto& err = composition.error();
        bounce::core::Log::error(std::string(bounce::core::toString(err.code())) + ": " + err.message()
                                 + " (" + err.location().file_name() + ":"
                                 + std::to_string(err.location().line()) + ")");
        return 1;
    }

    const auto& layout = composition->assignment.layout;
    std::printf("frames %u\n", static_cast<unsigned>(layout.horizon));
    for (const auto& platform : layout.platforms)
    {
        const auto& r = platform.rect();
        std::printf("platform %.3f %.3f %.3f %.3f %s %u\n",
                    r.x, r.y, r.width, r.height,
                    platform.isHorizontal() ? "horizontal" : "vertical",
                    static_cast<unsigned>(platform.expectedBounceFrame().value_or(0)));
    }
    for (const auto& wall : composition->walls)
        std::printf("wall %.3f %.3f %.3f %.3f\n", wall.x, wall.y, wall.width, wall.height);

    return 0;
}
