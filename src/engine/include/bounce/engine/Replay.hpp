// /////////////////////////////////////////////////////////////////////////////
/// @file Replay.hpp
/// @brief Two-phase replay: build a layout, then prove it reproduces the
///        intended bounce timing.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <bounce/engine/Config.hpp>
#include <bounce/physics/Platform.hpp>
#include <bounce/core/Types.hpp>

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace bounce::engine {

/// @brief Why a fixed layout failed to reproduce its timing.
enum class MismatchKind : core::u8
{
    kMissedBounce,    ///< A required frame elapsed with no contact.
    kMistimedBounce,  ///< Contact happened on a frame the layout does not expect.
};

/// @brief Typed validation failure; the solver's prune signal.
struct BounceMismatch
{
    MismatchKind               kind{MismatchKind::kMissedBounce};
    core::Frame                frame{0};
    std::optional<core::Frame> expected;

    [[nodiscard]] bool operator==(const BounceMismatch&) const = default;
};

[[nodiscard]] std::string describe(const BounceMismatch& mismatch);

/// @brief Platforms produced by a construction pass and the number of
///        frames it simulated.
struct Layout
{
    std::vector<physics::Platform> platforms;
    core::Frame                    horizon{0};
};

using ValidationResult = std::expected<void, BounceMismatch>;

// /////////////////////////////////////////////////////////////////////////////
/// @class Replay
/// @brief Construction and validation passes over independent scenes.
///
/// @p frames must be strictly ascending and non-zero; @p orientations holds
/// one bit per frame (true = horizontal platform).
// /////////////////////////////////////////////////////////////////////////////
class Replay
{
public:
    /// @brief Runs an empty scene up to the last frame, spawning one
    ///        platform before each listed frame is simulated.
    [[nodiscard]] static Layout construct(const Config& config,
                                          std::span<const core::Frame> frames,
                                          const std::vector<bool>& orientations);

    /// @brief Re-runs a fresh ball against a copy of @p layout.
    ///
    /// Fails on the first frame that is either a listed frame or a recorded
    /// expectation but sees no contact, or that sees contact with a
    /// platform expecting another frame or outside the listed frames.
    [[nodiscard]] static ValidationResult validate(const Config& config,
                                                   const Layout& layout,
                                                   std::span<const core::Frame> frames);

    /// @brief construct() followed by validate().
    [[nodiscard]] static std::expected<Layout, BounceMismatch> run(const Config& config,
                                                                   std::span<const core::Frame> frames,
                                                                   const std::vector<bool>& orientations);
};

} // namespace bounce::engine
