/**
 * @file TransferPacket.hpp
 * @brief The five save-transfer packets and their binary codec.
 *
 * Layouts (little endian):
 *   Announce  [tag][player][total_len:4][hash:4]                        10 B
 *   Data      [tag][player][seq:2][index:2][total:2][len:2][payload]    10 B + len
 *   Ack       [tag][player][last_seq:2][ack_bits:4]                      8 B
 *   Ready     [tag][player]                                              2 B
 *   Error     [tag][code][player]                                        3 B
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_PROTOCOL_TRANSFERPACKET_HPP
    #define CINDER_NET_PROTOCOL_TRANSFERPACKET_HPP

#include <cinder/net/protocol/Protocol.hpp>
#include <cinder/core/Types.hpp>
#include <cinder/core/Expected.hpp>

#include <optional>
#include <span>
#include <variant>

namespace cinder::net::protocol {

/** @brief Describes the save a player is about to send. */
struct AnnouncePacket
{
    core::u8  player{0};
    core::u32 totalLength{0};
    core::u32 hash{0};

    bool operator==(const AnnouncePacket&) const = default;
};

/** @brief One chunk of a save, placed by @c chunkIndex. */
struct DataPacket
{
    core::u8    player{0};
    core::u16   sequence{0};
    core::u16   chunkIndex{0};
    core::u16   totalChunks{0};
    core::Bytes payload;

    bool operator==(const DataPacket&) const = default;
};

/**
 * @brief Selective acknowledgement.
 *
 * Bit @c i of @c ackBits reports sequence @c lastSequence-1-i.  When
 * @c lastSequence is kControlSequence the bitfield is a receiver verdict.
 */
struct AckPacket
{
    core::u8  player{0};
    core::u16 lastSequence{0};
    core::u32 ackBits{0};

    bool operator==(const AckPacket&) const = default;
};

/** @brief The sender holds every save and is ready to start the match. */
struct ReadyPacket
{
    core::u8 player{0};

    bool operator==(const ReadyPacket&) const = default;
};

/** @brief Aborts the whole synchronization. */
struct ErrorPacket
{
    SyncError code{SyncError::ProtocolError};
    core::u8  player{0};

    bool operator==(const ErrorPacket&) const = default;
};

using TransferPacket = std::variant<AnnouncePacket, DataPacket, AckPacket, ReadyPacket, ErrorPacket>;

/**
 * @brief Serializes a packet.
 *
 * A Data packet's buffer is reserved to exactly its header plus payload.
 * Callers must respect the packet invariants (payload no larger than
 * kChunkSize, index below total); violations are programmer errors.
 */
[[nodiscard]] core::Bytes encode(const TransferPacket& packet);

/**
 * @brief Parses a datagram.
 *
 * Any inconsistency (unknown tag, wrong size, chunk_len disagreeing with the
 * remaining bytes, index out of range, player out of range, unknown error
 * code) yields ErrorCode::kMalformedPacket.  Nothing outside the returned
 * value is touched.
 */
[[nodiscard]] core::Expected<TransferPacket> decode(std::span<const core::byte> bytes);

/**
 * @brief Returns the packet kind if the first byte is a save-transfer tag.
 *
 * Lets a shared-channel dispatcher route datagrams without decoding them.
 */
[[nodiscard]] std::optional<PacketKind> peekKind(std::span<const core::byte> bytes) noexcept;

/** @brief Index of the participant that sent @p packet. */
[[nodiscard]] core::u8 senderOf(const TransferPacket& packet) noexcept;

} // namespace cinder::net::protocol

#endif // CINDER_NET_PROTOCOL_TRANSFERPACKET_HPP
