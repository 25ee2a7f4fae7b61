/**
 * @file ArqSender.hpp
 * @brief Sending half of one reliable save-data stream.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_SYNC_ARQSENDER_HPP
    #define CINDER_NET_SYNC_ARQSENDER_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/NonCopyable.hpp>
#include <cinder/net/protocol/TransferPacket.hpp>
#include <cinder/net/sync/StreamState.hpp>
#include <cinder/net/sync/SyncConfig.hpp>

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cinder::net::sync {

/**
 * @class ArqSender
 * @brief Pushes the local save to one remote player.
 *
 * Selective-repeat ARQ: the save is split into kChunkSize chunks, up to
 * windowSize of them are in flight, every transmission (retransmits
 * included) gets a fresh sequence number and each chunk carries its own
 * exponential-backoff timer.  After every chunk is acknowledged the sender
 * waits for the receiver's hash verdict, re-probing with the last chunk.
 *
 * Not thread-safe; driven by the coordinator from the bootstrap thread.
 */
class ArqSender final : public core::NonCopyable<ArqSender>
{
public:
    /**
     * @param localPlayer  Index stamped on outgoing packets.
     * @param remotePlayer Index of the receiving peer.
     * @param save         Local save, nullptr if the player has none.
     * @param config       Timing and retry budget.
     */
    ArqSender(core::u8 localPlayer, core::u8 remotePlayer,
              std::shared_ptr<const core::Bytes> save, const SyncConfig &config);

    /** @brief Emits the Announce and arms its timer. */
    void start(TimePoint now);

    /** @brief Processes a SACK or control ack from the remote receiver. */
    void onAck(const protocol::AckPacket &ack, TimePoint now);

    /** @brief Fires expired retransmit timers and refills the window. */
    void tick(TimePoint now);

    /** @brief Forces the stream into Failed, even from Complete; the first failure sticks. */
    void fail(protocol::SyncError error);

    /** @brief Moves queued packets to the back of @p out. */
    void takeOutgoing(std::vector<protocol::TransferPacket> &out);

    [[nodiscard]] StreamState                       state()         const noexcept { return _state; }
    [[nodiscard]] std::optional<protocol::SyncError> failure()      const noexcept { return _failure; }
    [[nodiscard]] core::u8                          remotePlayer()  const noexcept { return _remotePlayer; }
    [[nodiscard]] core::u16                         totalChunks()   const noexcept { return _totalChunks; }
    [[nodiscard]] core::u16                         ackedChunks()   const noexcept { return _ackedCount; }
    [[nodiscard]] core::u32                         retransmitCount() const noexcept { return _retransmits; }
    [[nodiscard]] core::u32                         fullResendCount() const noexcept { return _fullResends; }

private:
    struct ChunkSlot
    {
        bool      acked{false};
        bool      inFlight{false};
        TimePoint deadline{};
        Millis    timeout{};
        core::u32 retransmits{0};
    };

    void sendAnnounce();
    void sendChunk(core::u16 index, TimePoint now);
    void pump(TimePoint now);
    void acknowledge(core::u16 sequence);
    void handleControl(core::u32 verdict, TimePoint now);
    void checkChunkTimers(TimePoint now);
    void checkControlTimer(TimePoint now);
    void enterVerifying(TimePoint now);
    void restart(TimePoint now);

    [[nodiscard]] Millis    backoff(Millis current) const noexcept;
    [[nodiscard]] core::u16 chunkLength(core::u16 index) const noexcept;

    core::u8                           _localPlayer;
    core::u8                           _remotePlayer;
    std::shared_ptr<const core::Bytes> _save;
    SyncConfig                         _config;
    core::u32                          _window;

    StreamState                        _state{StreamState::Idle};
    std::optional<protocol::SyncError> _failure;

    core::u32 _totalLength{0};
    core::u32 _hash{0};
    core::u16 _totalChunks{0};
    core::u16 _ackedCount{0};
    core::u16 _nextSequence{1};

    std::vector<ChunkSlot>                   _chunks;
    std::unordered_map<core::u16, core::u16> _sequenceToChunk;

    // Shared by the Announce (Announcing) and the verdict probe (Verifying).
    TimePoint _controlDeadline{};
    Millis    _controlTimeout{};
    core::u32 _controlRetransmits{0};

    core::u32 _retransmits{0};
    core::u32 _fullResends{0};

    std::vector<protocol::TransferPacket> _outbox;
};

} // namespace cinder::net::sync

#endif // CINDER_NET_SYNC_ARQSENDER_HPP
