/**
 * @file Rect.hpp
 * @brief Axis-aligned rectangle used for the ball, platforms and walls.
 *
 * Stored as top-left corner plus extent (y grows downwards).  Two
 * intersection flavours are provided: overlaps() is strict, so rectangles
 * that only share an edge do not collide; touches() also accepts shared
 * edges.
 *
 * @tparam T Scalar type satisfying bounce::core::Arithmetic.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_MATH_RECT_HPP
    #define BOUNCE_MATH_RECT_HPP

    #include "Vec2.hpp"

namespace bounce::math {

template <core::Arithmetic T>
struct Rect final {
    T x{};
    T y{};
    T width{};
    T height{};

    constexpr Rect() = default;
    constexpr Rect(T x, T y, T width, T height);

    /// @brief Rectangle spanning two arbitrary opposite corners.
    [[nodiscard]] static constexpr Rect fromCorners(Vec2<T> a, Vec2<T> b);

    [[nodiscard]] constexpr T left()   const { return x; }
    [[nodiscard]] constexpr T right()  const { return x + width; }
    [[nodiscard]] constexpr T top()    const { return y; }
    [[nodiscard]] constexpr T bottom() const { return y + height; }

    [[nodiscard]] constexpr Vec2<T> position() const { return {x, y}; }

    [[nodiscard]] constexpr bool isValid()               const;
    [[nodiscard]] constexpr bool overlaps(Rect other)    const;
    [[nodiscard]] constexpr bool touches(Rect other)     const;
    [[nodiscard]] constexpr bool contains(Vec2<T> point) const;
    [[nodiscard]] constexpr bool contains(Rect other)    const;
    [[nodiscard]] constexpr Rect merge(Rect other)       const;
    [[nodiscard]] constexpr T    area()                  const;

    [[nodiscard]] constexpr bool operator==(const Rect &) const = default;
};

// ─── Inline implementations ─────────────────────────────────────────────────

template <core::Arithmetic T>
constexpr Rect<T>::Rect(T x_, T y_, T w, T h) : x(x_), y(y_), width(w), height(h) {}

template <core::Arithmetic T>
constexpr Rect<T> Rect<T>::fromCorners(Vec2<T> a, Vec2<T> b)
{
    const T lx = (a.x < b.x) ? a.x : b.x;
    const T hx = (a.x < b.x) ? b.x : a.x;
    const T ly = (a.y < b.y) ? a.y : b.y;
    const T hy = (a.y < b.y) ? b.y : a.y;
    return Rect{lx, ly, hx - lx, hy - ly};
}

template <core::Arithmetic T>
constexpr bool Rect<T>::isValid() const
{
    return width > T{} && height > T{};
}

template <core::Arithmetic T>
constexpr bool Rect<T>::overlaps(Rect other) const
{
    return right() > other.left() && left() < other.right()
        && bottom() > other.top() && top() < other.bottom();
}

template <core::Arithmetic T>
constexpr bool Rect<T>::touches(Rect other) const
{
    return right() >= other.left() && left() <= other.right()
        && bottom() >= other.top() && top() <= other.bottom();
}

template <core::Arithmetic T>
constexpr bool Rect<T>::contains(Vec2<T> point) const
{
    return point.x >= left() && point.x <= right()
        && point.y >= top()  && point.y <= bottom();
}

template <core::Arithmetic T>
constexpr bool Rect<T>::contains(Rect other) const
{
    return other.left() >= left() && other.right()  <= right()
        && other.top()  >= top()  && other.bottom() <= bottom();
}

template <core::Arithmetic T>
constexpr Rect<T> Rect<T>::merge(Rect other) const
{
    auto lo = [](T a, T b) { return (a < b) ? a : b; };
    auto hi = [](T a, T b) { return (a > b) ? a : b; };
    const T l = lo(left(), other.left());
    const T t = lo(top(), other.top());
    return Rect{l, t, hi(right(), other.right()) - l, hi(bottom(), other.bottom()) - t};
}

template <core::Arithmetic T>
constexpr T Rect<T>::area() const
{
    return width * height;
}

using Rectd = Rect<double>;

} // namespace bounce::math

#endif // BOUNCE_MATH_RECT_HPP
