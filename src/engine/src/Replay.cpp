// /////////////////////////////////////////////////////////////////////////////
/// @file Replay.cpp
/// @brief Construction and validation passes.
// /////////////////////////////////////////////////////////////////////////////

#include <bounce/engine/Replay.hpp>
#include <bounce/engine/Scene.hpp>
#include <bounce/core/Assert.hpp>

#include <algorithm>

namespace bounce::engine {

std::string describe(const BounceMismatch& mismatch)
{
    if (mismatch.kind == MismatchKind::kMissedBounce)
        return "bounce should have happened on frame " + std::to_string(mismatch.frame) + " but did not";

    std::string msg = "platform hit on frame " + std::to_string(mismatch.frame);
    if (mismatch.expected)
        msg += " but expected on frame " + std::to_string(*mismatch.expected);
    else
        msg += " but it was never hit while being placed";
    return msg;
}

Layout Replay::construct(const Config& config,
                         std::span<const core::Frame> frames,
                         const std::vector<bool>& orientations)
{
    BOUNCE_ASSERT(frames.size() == orientations.size());

    Layout layout;
    if (frames.empty())
        return layout;

    std::vector<Spawn> spawns;
    spawns.reserve(frames.size());
    for (core::usize i = 0; i < frames.size(); ++i)
        spawns.push_back(Spawn{frames[i], orientations[i]});

    Scene scene{config};
    scene.setSpawns(std::move(spawns));

    layout.horizon = frames.back();
    while (scene.frame() < layout.horizon)
        (void)scene.step();

    layout.platforms = std::move(scene).takePlatforms();
    return layout;
}

ValidationResult Replay::validate(const Config& config,
                                  const Layout& layout,
                                  std::span<const core::Frame> frames)
{
    std::vector<std::optional<core::Frame>> recorded;
    recorded.reserve(layout.platforms.size());
    std::vector<core::Frame> required(frames.begin(), frames.end());
    for (const auto& platform : layout.platforms)
    {
        recorded.push_back(platform.expectedBounceFrame());
        if (platform.expectedBounceFrame())
            required.push_back(*platform.expectedBounceFrame());
    }
    std::sort(required.begin(), required.end());

    auto isTarget   = [&](core::Frame f) { return std::binary_search(frames.begin(), frames.end(), f); };
    auto isRequired = [&](core::Frame f) { return std::binary_search(required.begin(), required.end(), f); };

    Scene scene{config};
    scene.setPlatforms(layout.platforms);

    while (scene.frame() < layout.horizon)
    {
        const StepResult step = scene.step();

        if (!step.hitPlatform)
        {
            if (isRequired(step.frame))
                return std::unexpected(BounceMismatch{MismatchKind::kMissedBounce, step.frame, std::nullopt});
            continue;
        }

        const auto expected = recorded[*step.hitPlatform];
        if (expected != step.frame || !isTarget(step.frame))
            return std::unexpected(BounceMismatch{MismatchKind::kMistimedBounce, step.frame, expected});
    }
    return {};
}

std::expected<Layout, BounceMismatch> Replay::run(const Config& config,
                                                  std::span<const core::Frame> frames,
                                                  const std::vector<bool>& orientations)
{
    Layout layout = construct(config, frames, orientations);
    if (auto valid = validate(config, layout, frames); !valid)
        return std::unexpected(valid.error());
    return layout;
}

} // namespace bounce::engine
