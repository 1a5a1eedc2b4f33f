/**
 * @file CollisionEngine.hpp
 * @brief Discrete one-step ball advance with AABB contact resolution.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#pragma once

#ifndef BOUNCE_PHYSICS_COLLISIONENGINE_HPP
    #define BOUNCE_PHYSICS_COLLISIONENGINE_HPP

#include <bounce/physics/Ball.hpp>
#include <bounce/physics/Platform.hpp>
#include <bounce/physics/Wall.hpp>
#include <bounce/math/Rect.hpp>
#include <bounce/core/Types.hpp>

#include <optional>
#include <span>

namespace bounce::physics {

/**
 * @brief Platform side the ball is pushed out through. The enumeration
 *        order is the tie-break order.
 */
enum class ContactSide : core::u8
{
    kLeft = 0,
    kRight,
    kTop,
    kBottom
};

/**
 * @struct Contact
 * @brief First platform overlapped by the ball's next-position box.
 */
struct Contact
{
    core::usize  platformIndex{0};
    ContactSide  side{ContactSide::kLeft};
    core::f64    penetration{0.0};
};

/**
 * @class CollisionEngine
 * @brief Stateless step functions over a caller-owned ball and platform list.
 *
 * Contact is first-in-list, not closest: platforms are scanned in order and
 * the first one strictly overlapping the ball's next box is the only one
 * resolved this step.  All functions are deterministic and perform no I/O.
 */
class CollisionEngine
{
public:
    /**
     * @brief Finds the first platform overlapping @p nextBall.
     * @param nextBall  Ball bounding box at its unobstructed next position.
     * @param platforms Platforms in list order.
     * @return The contact with its minimal-penetration side, if any.
     */
    [[nodiscard]] static std::optional<Contact> findContact(
        const math::Rectd& nextBall,
        std::span<const Platform> platforms) noexcept;

    /**
     * @brief Points the velocity away from the platform on the contact axis
     *        and places the ball flush against that edge.
     *
     * Only the sign of the resolved velocity component changes; the other
     * component and the other coordinate are untouched.
     */
    static void resolve(Ball& ball, const math::Rectd& platform, ContactSide side) noexcept;

    /**
     * @brief Advances the ball one frame.
     *
     * Resolves at most one contact, records @p frame as the hit platform's
     * expected bounce frame (first write wins), then applies the velocity.
     *
     * @return Index of the platform hit on this frame.
     */
    [[nodiscard]] static std::optional<core::usize> step(
        Ball& ball,
        std::span<Platform> platforms,
        core::Frame frame) noexcept;

    /**
     * @brief Hides every visible wall touching the swept @p region, edges
     *        included.
     * @return Number of walls carved by this call.
     */
    static core::usize carve(const math::Rectd& region, std::span<Wall> walls) noexcept;

    /// @brief Hides walls strictly overlapping a struck platform. Grid cells
    ///        sharing only an edge with it stay.
    static core::usize carveBeneath(const math::Rectd& platform, std::span<Wall> walls) noexcept;
};

} // namespace bounce::physics

#endif // BOUNCE_PHYSICS_COLLISIONENGINE_HPP
