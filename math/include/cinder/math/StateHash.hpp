/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash for save-content verification.
 *
 * The same digest is announced on the wire before a save transfer, checked
 * by the receiver once reassembly completes, and stored in the header of
 * every save file written to disk.  The wire and file formats carry 32 bits,
 * obtained by folding the 64-bit digest (high word XOR low word).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_MATH_STATE_HASH_HPP
    #define CINDER_MATH_STATE_HASH_HPP

    #include <cinder/core/Types.hpp>

    #include <span>
    #include <type_traits>

namespace cinder::math {

/**
 * @brief Incremental FNV-1a hasher.
 */
class StateHash final {
public:
    static constexpr core::u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr core::u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashBytes(std::span<const core::byte> data);

    /**
     * @brief Feed an unsigned integer in little-endian byte order.
     *
     * Integers are hashed through their explicit byte encoding rather than
     * their in-memory representation so digests match across hosts.
     */
    template <typename T>
        requires std::is_unsigned_v<T>
    StateHash &combine(T value)
    {
        for (core::usize i = 0; i < sizeof(T); ++i)
        {
            _hash ^= static_cast<core::u64>((value >> (8 * i)) & 0xFFu);
            _hash *= kPrime;
        }
        return *this;
    }

    /**
     * @brief Finalise and return the current digest.
     * @return 64-bit FNV-1a hash.
     */
    [[nodiscard]] constexpr core::u64 digest() const { return _hash; }

    /**
     * @brief 32-bit fold of the digest used by the wire and file formats.
     */
    [[nodiscard]] constexpr core::u32 digest32() const
    {
        return static_cast<core::u32>(_hash >> 32) ^ static_cast<core::u32>(_hash);
    }

    /**
     * @brief Reset the hasher to its initial state.
     */
    constexpr void reset() { _hash = kOffsetBasis; }

private:
    core::u64 _hash = kOffsetBasis;
};

/**
 * @brief One-shot 32-bit content hash of a save payload.
 */
[[nodiscard]] core::u32 contentHash(std::span<const core::byte> data);

} // namespace cinder::math

#endif // CINDER_MATH_STATE_HASH_HPP
