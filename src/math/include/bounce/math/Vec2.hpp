/**
 * @file Vec2.hpp
 * @brief 2-component vector template for the planar simulation.
 *
 * @tparam T Scalar type satisfying bounce::core::Arithmetic.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_MATH_VEC2_HPP
    #define BOUNCE_MATH_VEC2_HPP

    #include <bounce/core/Concepts.hpp>

namespace bounce::math {

template <core::Arithmetic T>
struct Vec2 final {
    T x{};
    T y{};

    constexpr Vec2() = default;
    constexpr Vec2(T x, T y);

    [[nodiscard]] constexpr Vec2 operator+(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator-(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec2 operator-()          const;

    constexpr Vec2 &operator+=(Vec2 rhs);
    constexpr Vec2 &operator-=(Vec2 rhs);

    [[nodiscard]] constexpr bool operator==(const Vec2 &) const = default;

    [[nodiscard]] constexpr T dot(Vec2 rhs)    const;
    [[nodiscard]] constexpr T lengthSquared()  const;

    static constexpr Vec2 zero();
};

using Vec2d = Vec2<double>;

} // namespace bounce::math

    #include "Vec2.inl"

#endif // BOUNCE_MATH_VEC2_HPP
