/**
 * @file StateHash.cpp
 * @brief FNV-1a byte folding.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#include "bounce/math/StateHash.hpp"

namespace bounce::math {

void StateHash::fold(std::span<const core::byte> bytes)
{
    for (const core::byte b : bytes)
    {
        _hash ^= std::to_integer<core::u64>(b);
        _hash *= kPrime;
    }
}

} // namespace bounce::math
