/**
 * @file ArqReceiver.hpp
 * @brief Receiving half of one reliable save-data stream.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_SYNC_ARQRECEIVER_HPP
    #define CINDER_NET_SYNC_ARQRECEIVER_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/NonCopyable.hpp>
#include <cinder/net/protocol/TransferPacket.hpp>
#include <cinder/net/sync/SequenceWindow.hpp>
#include <cinder/net/sync/StreamState.hpp>
#include <cinder/net/sync/SyncConfig.hpp>

#include <optional>
#include <vector>

namespace cinder::net::sync {

/**
 * @class ArqReceiver
 * @brief Reassembles one remote player's save and verifies its hash.
 *
 * Chunks are placed by index so reordering and duplicates are harmless.
 * Every Data packet is answered with a SACK, and a SACK is also repeated
 * every ackInterval while the transfer runs.  A hash mismatch asks the
 * sender to resend everything (kAckResend) up to maxHashRetries times.
 */
class ArqReceiver final : public core::NonCopyable<ArqReceiver>
{
public:
    ArqReceiver(core::u8 localPlayer, core::u8 remotePlayer, const SyncConfig &config);

    /** @brief Enters Announcing; the silence clock starts here. */
    void start(TimePoint now);

    void onAnnounce(const protocol::AnnouncePacket &announce, TimePoint now);
    void onData(const protocol::DataPacket &data, TimePoint now);

    /** @brief Periodic acks, and the peer silence check until the save is received. */
    void tick(TimePoint now);

    /** @brief Forces the stream into Failed and drops the buffer; the first failure sticks. */
    void fail(protocol::SyncError error);

    /** @brief Moves queued acks to the back of @p out. */
    void takeOutgoing(std::vector<protocol::TransferPacket> &out);

    /**
     * @brief Copy of the verified save.
     *
     * Only meaningful once Complete; yields std::nullopt for an absent save.
     * The buffer is kept, so the result can be read any number of times.
     */
    [[nodiscard]] std::optional<core::Bytes> result() const;

    [[nodiscard]] StreamState                        state()        const noexcept { return _state; }
    [[nodiscard]] std::optional<protocol::SyncError> failure()      const noexcept { return _failure; }
    [[nodiscard]] core::u8                           remotePlayer() const noexcept { return _remotePlayer; }
    [[nodiscard]] core::u32                          totalLength()  const noexcept { return _totalLength; }
    [[nodiscard]] core::u32                          hashRetries()  const noexcept { return _hashRetries; }
    [[nodiscard]] bool                               isAbsent()     const noexcept { return _absent; }

private:
    void sendAck();
    void sendControl(core::u32 verdict);
    void verify(TimePoint now);
    void complete();

    [[nodiscard]] core::usize expectedLength(core::u16 index) const noexcept;

    core::u8   _localPlayer;
    core::u8   _remotePlayer;
    SyncConfig _config;

    StreamState                        _state{StreamState::Idle};
    std::optional<protocol::SyncError> _failure;

    bool        _announced{false};
    bool        _absent{false};
    core::u32   _totalLength{0};
    core::u32   _hash{0};
    core::u16   _totalChunks{0};
    core::u16   _filledCount{0};
    core::Bytes _buffer;
    std::vector<bool> _filled;

    SequenceWindow _window;
    TimePoint      _lastActivity{};
    TimePoint      _lastAckSent{};
    core::u32      _hashRetries{0};

    std::vector<protocol::TransferPacket> _outbox;
};

} // namespace cinder::net::sync

#endif // CINDER_NET_SYNC_ARQRECEIVER_HPP
