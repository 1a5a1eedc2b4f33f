/**
 * @file Error.hpp
 * @brief Why a configuration or a solve was refused.
 *
 * An Error keeps the code, a message naming the offending value and the
 * place that raised it.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_CORE_ERROR_HPP
    #define BOUNCE_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace bounce::core {

/**
 * @brief Reasons a solve or a configuration build can fail.
 */
enum class ErrorCode : u16 {
    kInvalidArgument = 1,  ///< Bad config value or a target frame of 0.
    kNoValidPlacement,     ///< Every orientation sequence was rejected.
    kBudgetExhausted,      ///< SearchOptions::maxNodes reached first.
    kCancelled,            ///< The cancel flag was raised mid-search.
};

/**
 * @brief Stable lowercase name of an error code, for log lines.
 */
[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kInvalidArgument:  return "invalid argument";
        case ErrorCode::kNoValidPlacement: return "no valid placement";
        case ErrorCode::kBudgetExhausted:  return "search budget exhausted";
        case ErrorCode::kCancelled:        return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Intended to be stored inside Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace bounce::core

#endif // BOUNCE_CORE_ERROR_HPP
