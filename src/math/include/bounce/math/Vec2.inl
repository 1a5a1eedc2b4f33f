/**
 * @file Vec2.inl
 * @brief Inline implementation of Vec2 operations.
 * @see   Vec2.hpp
 */

#ifndef BOUNCE_MATH_VEC2_INL
    #define BOUNCE_MATH_VEC2_INL

namespace bounce::math {

template <core::Arithmetic T>
constexpr Vec2<T>::Vec2(T x_, T y_) : x(x_), y(y_) {}

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator+(Vec2 rhs) const { return {x + rhs.x, y + rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-(Vec2 rhs) const { return {x - rhs.x, y - rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator*(T s) const { return {x * s, y * s}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-() const { return {-x, -y}; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator+=(Vec2 rhs) { x += rhs.x; y += rhs.y; return *this; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator-=(Vec2 rhs) { x -= rhs.x; y -= rhs.y; return *this; }

template <core::Arithmetic T>
constexpr T Vec2<T>::dot(Vec2 rhs) const { return x * rhs.x + y * rhs.y; }

template <core::Arithmetic T>
constexpr T Vec2<T>::lengthSquared() const { return dot(*this); }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::zero() { return {T{}, T{}}; }

} // namespace bounce::math

#endif // BOUNCE_MATH_VEC2_INL
