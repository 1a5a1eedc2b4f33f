/**
 * @file Expected.hpp
 * @brief Error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and a
 * BOUNCE_TRY_VOID macro for early-return propagation.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_CORE_EXPECTED_HPP
    #define BOUNCE_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace bounce::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace bounce::core

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type bounce::core::ExpectedVoid.
 */
#define BOUNCE_TRY_VOID(expr)                                             \
    do {                                                                    \
        auto &&_bounce_result = (expr);                                    \
        if (!_bounce_result.has_value()) [[unlikely]]                      \
            return std::unexpected(std::move(_bounce_result.error()));      \
    } while (false)

#endif // BOUNCE_CORE_EXPECTED_HPP
