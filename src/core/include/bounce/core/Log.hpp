/**
 * @file Log.hpp
 * @brief Tagged logging for the solver, wall and composer passes.
 *
 * Messages carry a subsystem tag ("SOLVER", "WALLS", "COMPOSER") and go to
 * the installed ILogger, stderr by default. The solver's per-node progress
 * is debug level and is only formatted when isEnabled(kDebug) holds.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_CORE_LOG_HPP
    #define BOUNCE_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace bounce::core {

enum class LogLevel : u8 {
    kDebug = 0,  ///< Search progress and pruned prefixes.
    kInfo,       ///< Search start and result, wall counts.
    kWarn,       ///< Failed solves.
    kError,      ///< Unusable input at the application level.
};

/**
 * @brief Destination for log lines. Tests install one to capture output.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    [[nodiscard]] static bool isEnabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);

    /// @brief Untagged error, reported under "bounce".
    static void error(std::string_view msg) { error("bounce", msg); }
};

} // namespace bounce::core

#endif // BOUNCE_CORE_LOG_HPP
