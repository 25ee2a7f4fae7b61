/**
 * @file SequenceWindow.hpp
 * @brief Wrapping 16-bit sequence arithmetic and the receiver's SACK window.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_SYNC_SEQUENCEWINDOW_HPP
    #define CINDER_NET_SYNC_SEQUENCEWINDOW_HPP

#include <cinder/core/Types.hpp>

namespace cinder::net::sync {

/** @brief Number of sequences a single Ack reports besides its last_sequence. */
static constexpr core::u32 kAckBits = 32;

/**
 * @brief Returns @c true if @p a is more recent than @p b, across wrap.
 */
[[nodiscard]] inline constexpr bool sequenceGreaterThan(core::u16 a, core::u16 b) noexcept
{
    return ((a > b) && (a - b <= 32768)) || ((a < b) && (b - a > 32768));
}

/**
 * @brief Next data sequence after @p seq; 0 is reserved for control acks.
 */
[[nodiscard]] inline constexpr core::u16 nextSequence(core::u16 seq) noexcept
{
    const auto next = static_cast<core::u16>(seq + 1);
    return next == 0 ? core::u16{1} : next;
}

/**
 * @class SequenceWindow
 * @brief Tracks the newest received sequence and the 32 before it.
 */
class SequenceWindow final
{
public:
    /**
     * @brief Records a received sequence.
     *
     * Sequences older than the window are forgotten; duplicates are no-ops.
     */
    void record(core::u16 sequence) noexcept;

    /** @brief Forgets everything (used when a full resend starts). */
    void reset() noexcept;

    /** @brief @c true once any sequence was recorded. */
    [[nodiscard]] bool any() const noexcept { return _any; }

    /** @brief Newest recorded sequence, 0 if none. */
    [[nodiscard]] core::u16 last() const noexcept { return _last; }

    /** @brief Bit @c i set if sequence @c last()-1-i was received. */
    [[nodiscard]] core::u32 bits() const noexcept { return _bits; }

    /** @brief @c true if @p sequence is reported by the current window. */
    [[nodiscard]] bool contains(core::u16 sequence) const noexcept;

private:
    core::u16 _last{0};
    core::u32 _bits{0};
    bool      _any{false};
};

} // namespace cinder::net::sync

#endif // CINDER_NET_SYNC_SEQUENCEWINDOW_HPP
