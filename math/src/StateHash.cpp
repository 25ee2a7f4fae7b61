/**
 * @file StateHash.cpp
 * @brief StateHash implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/math/StateHash.hpp>

namespace cinder::math {

StateHash &StateHash::hashBytes(std::span<const core::byte> data)
{
    for (const auto b : data)
    {
        _hash ^= static_cast<core::u64>(static_cast<core::u8>(b));
        _hash *= kPrime;
    }
    return *this;
}

core::u32 contentHash(std::span<const core::byte> data)
{
    StateHash hasher;
    hasher.hashBytes(data);
    return hasher.digest32();
}

} // namespace cinder::math
