/**
 * @file StateHash.hpp
 * @brief FNV-1a digest of a ball trajectory.
 *
 * Trajectory::fingerprint() folds every sample into one StateHash. Two
 * replays of the same layout must agree bit for bit, so their digests are
 * equal; any drift in the float state changes the digest.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef BOUNCE_MATH_STATE_HASH_HPP
    #define BOUNCE_MATH_STATE_HASH_HPP

    #include <bounce/core/Types.hpp>
    #include <bounce/core/Concepts.hpp>

    #include <span>

namespace bounce::math {

class StateHash final {
public:
    static constexpr core::u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr core::u64 kPrime       = 1099511628211ULL;

    /// @brief Folds each value's object representation, left to right.
    template <core::Blittable... Ts>
    StateHash &combine(const Ts &...values)
    {
        (fold(std::as_bytes(std::span<const Ts, 1>{&values, 1})), ...);
        return *this;
    }

    [[nodiscard]] constexpr core::u64 digest() const { return _hash; }

private:
    void fold(std::span<const core::byte> bytes);

    core::u64 _hash = kOffsetBasis;
};

} // namespace bounce::math

#endif // BOUNCE_MATH_STATE_HASH_HPP
