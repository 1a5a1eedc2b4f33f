/**
 * @file CollisionEngine.cpp
 * @brief Minimal-penetration-axis contact resolution.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <bounce/physics/CollisionEngine.hpp>

#include <array>
#include <cmath>

namespace bounce::physics {

std::optional<Contact> CollisionEngine::findContact(
    const math::Rectd& nextBall,
    std::span<const Platform> platforms) noexcept
{
    for (core::usize i = 0; i < platforms.size(); ++i)
    {
        const math::Rectd& plat = platforms[i].rect();
        if (!nextBall.overlaps(plat))
            continue;

        const std::array<core::f64, 4> depths{
            nextBall.right() - plat.left(),
            plat.right()     - nextBall.left(),
            nextBall.bottom() - plat.top(),
            plat.bottom()    - nextBall.top(),
        };

        core::usize best = 0;
        for (core::usize side = 1; side < depths.size(); ++side)
        {
            if (depths[side] < depths[best])
                best = side;
        }

        return Contact{i, static_cast<ContactSide>(best), depths[best]};
    }
    return std::nullopt;
}

void CollisionEngine::resolve(Ball& ball, const math::Rectd& platform, ContactSide side) noexcept
{
    switch (side)
    {
        case ContactSide::kLeft:
            ball.velocity.x = -std::abs(ball.velocity.x);
            ball.position.x = platform.left() - ball.size;
            break;
        case ContactSide::kRight:
            ball.velocity.x = std::abs(ball.velocity.x);
            ball.position.x = platform.right();
            break;
        case ContactSide::kTop:
            ball.velocity.y = -std::abs(ball.velocity.y);
            ball.position.y = platform.top() - ball.size;
            break;
        case ContactSide::kBottom:
            ball.velocity.y = std::abs(ball.velocity.y);
            ball.position.y = platform.bottom();
            break;
    }
}

std::optional<core::usize> CollisionEngine::step(
    Ball& ball,
    std::span<Platform> platforms,
    core::Frame frame) noexcept
{
    const auto nextBox = ball.boundsAt(ball.predictPosition());
    const auto contact = findContact(nextBox, platforms);

    if (contact)
    {
        Platform& plat = platforms[contact->platformIndex];
        resolve(ball, plat.rect(), contact->side);
        plat.setExpectedBounceFrame(frame);
    }

    ball.position += ball.velocity;

    if (!contact)
        return std::nullopt;
    return contact->platformIndex;
}

core::usize CollisionEngine::carve(const math::Rectd& region, std::span<Wall> walls) noexcept
{
    core::usize carved = 0;
    for (Wall& wall : walls)
    {
        if (wall.visible && region.touches(wall.rect))
        {
            wall.carve();
            ++carved;
        }
    }
    return carved;
}

core::usize CollisionEngine::carveBeneath(const math::Rectd& platform, std::span<Wall> walls) noexcept
{
    core::usize carved = 0;
    for (Wall& wall : walls)
    {
        if (wall.visible && platform.overlaps(wall.rect))
        {
            wall.carve();
            ++carved;
        }
    }
    return carved;
}

} // namespace bounce::physics
