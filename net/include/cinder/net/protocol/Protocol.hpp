/**
 * @file Protocol.hpp
 * @brief Save-transfer wire constants, packet tags and error codes.
 *
 * The save-sync datagrams share the channel used by the rollback transport.
 * Their tags occupy 0x01..0x05 so a dispatcher can route them with a
 * single byte test.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_PROTOCOL_PROTOCOL_HPP
    #define CINDER_NET_PROTOCOL_PROTOCOL_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Error.hpp>

#include <string_view>

namespace cinder::net::protocol {

/**
 * @enum PacketKind
 * @brief First byte of every save-transfer datagram.
 */
enum class PacketKind : core::u8
{
    Announce = 0x01,
    Data     = 0x02,
    Ack      = 0x03,
    Ready    = 0x04,
    Error    = 0x05
};

/** @brief Fixed sizes of each layout (Data excludes its payload). */
static constexpr core::usize kAnnounceSize   = 10;
static constexpr core::usize kDataHeaderSize = 10;
static constexpr core::usize kAckSize        = 8;
static constexpr core::usize kReadySize      = 2;
static constexpr core::usize kErrorSize      = 3;

static_assert(kDataHeaderSize + core::kChunkSize <= core::kMaxDatagramSize,
              "a full Data packet must fit in one datagram");

/**
 * @brief Control acknowledgements.
 *
 * Data sequences start at 1 and skip 0 on wrap, so an Ack whose
 * last_sequence is 0 never acknowledges a chunk.  Its bitfield then carries
 * one of these receiver verdicts instead of a SACK mask.
 */
static constexpr core::u16 kControlSequence = 0;
static constexpr core::u32 kAckAnnounced    = 0x00000000;
static constexpr core::u32 kAckVerified     = 0x00000001;
static constexpr core::u32 kAckResend       = 0x00000002;

/**
 * @brief Announced hash meaning "this player has no save at all".
 *
 * Only meaningful together with a zero total length; the hash of an
 * empty buffer is never zero.
 */
static constexpr core::u32 kAbsentSaveHash = 0;

/**
 * @enum SyncError
 * @brief Failure taxonomy of the save synchronization, as carried by the
 *        Error packet's code byte.
 */
enum class SyncError : core::u8
{
    TooLarge        = 1, ///< Announced length exceeds the per-player save limit.
    Timeout         = 2, ///< Retransmit budget or global sync timeout exhausted.
    HashMismatch    = 3, ///< Reassembled buffer failed verification after retries.
    Disconnected    = 4, ///< Peer vanished mid-transfer.
    ProtocolError   = 5, ///< Out-of-sequence or inconsistent packet.
    MalformedPacket = 6  ///< Codec-level decode failure.
};

/** @brief Returns @c true if @p code is a valid SyncError wire value. */
[[nodiscard]] inline constexpr bool isValidSyncError(core::u8 code) noexcept
{
    return code >= static_cast<core::u8>(SyncError::TooLarge)
        && code <= static_cast<core::u8>(SyncError::MalformedPacket);
}

/** @brief Human-readable reason, used in bootstrap failure messages. */
[[nodiscard]] std::string_view describe(SyncError error) noexcept;

/** @brief Maps a sync failure onto the console-wide error code. */
[[nodiscard]] core::ErrorCode toErrorCode(SyncError error) noexcept;

} // namespace cinder::net::protocol

#endif // CINDER_NET_PROTOCOL_PROTOCOL_HPP
