/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every module.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_CORE_TYPES_HPP
    #define BOUNCE_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace bounce::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;

using byte = std::byte;

/**
 * @brief Index of a discrete simulation step. The first simulated step is
 *        frame 1; frame 0 denotes the initial state.
 */
using Frame = u32;

} // namespace bounce::core

#endif // BOUNCE_CORE_TYPES_HPP
