/**
 * @file Constants.hpp
 * @brief Compile-time defaults for the scene configuration.
 *
 * Arena and ball defaults describe a portrait 1088x1920 canvas with a
 * 100-unit ball starting at its centre.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_CORE_CONSTANTS_HPP
    #define BOUNCE_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace bounce::core {

inline constexpr f64   kDefaultArenaWidth      = 1088.0;
inline constexpr f64   kDefaultArenaHeight     = 1920.0;

inline constexpr f64   kDefaultBallSize        = 100.0;
inline constexpr f64   kDefaultBallSpeed       = 15.0;
inline constexpr f64   kDefaultBallStartX      = kDefaultArenaWidth  / 2.0;
inline constexpr f64   kDefaultBallStartY      = kDefaultArenaHeight / 2.0;

inline constexpr f64   kDefaultPlatformThickness = kDefaultBallSize / 2.0;
inline constexpr f64   kDefaultPlatformLength    = kDefaultBallSize * 2.0;

inline constexpr f64   kDefaultEdgeWallScale   = 2.0;
inline constexpr f64   kCameraEdgeFraction     = 0.4;

} // namespace bounce::core

#endif // BOUNCE_CORE_CONSTANTS_HPP
