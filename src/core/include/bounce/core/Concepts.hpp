/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining the generic math types.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_CORE_CONCEPTS_HPP
    #define BOUNCE_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace bounce::core {

/**
 * @brief A type that supports basic arithmetic operations.
 */
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T> || requires(T a, T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to feed byte-wise into a hash.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

} // namespace bounce::core

#endif // BOUNCE_CORE_CONCEPTS_HPP
