/**
 * @file SaveSyncCoordinator.hpp
 * @brief Pre-match exchange of every participant's save.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_SYNC_SAVESYNCCOORDINATOR_HPP
    #define CINDER_NET_SYNC_SAVESYNCCOORDINATOR_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Expected.hpp>
#include <cinder/core/NonCopyable.hpp>
#include <cinder/net/protocol/TransferPacket.hpp>
#include <cinder/net/sync/ArqReceiver.hpp>
#include <cinder/net/sync/ArqSender.hpp>
#include <cinder/net/sync/SyncConfig.hpp>
#include <cinder/save/SaveSlots.hpp>

#include <array>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace cinder::net::sync {

using protocol::SyncError;

/** @brief Target value meaning "every remote participant". */
static constexpr core::u8 kBroadcast = 0xFF;

/**
 * @struct OutgoingPacket
 * @brief An encoded datagram and the player it is addressed to.
 */
struct OutgoingPacket
{
    core::u8    target{kBroadcast};
    core::Bytes bytes;
};

/**
 * @struct SyncResult
 * @brief Outcome of feeding the coordinator a packet or a tick.
 */
struct SyncResult
{
    enum class Status : core::u8
    {
        Continue,
        Complete,
        Error
    };

    Status    status{Status::Continue};
    SyncError error{SyncError::ProtocolError}; ///< Valid when status is Error.
    core::u8  origin{0};                       ///< Player that raised the error.

    [[nodiscard]] static SyncResult proceed()  { return {}; }
    [[nodiscard]] static SyncResult complete() { return {Status::Complete, SyncError::ProtocolError, 0}; }
    [[nodiscard]] static SyncResult failed(SyncError error, core::u8 origin)
    {
        return {Status::Error, error, origin};
    }

    [[nodiscard]] bool isComplete() const noexcept { return status == Status::Complete; }
    [[nodiscard]] bool isError()    const noexcept { return status == Status::Error; }
};

/**
 * @class SaveSyncCoordinator
 * @brief Runs one ArqSender and one ArqReceiver per remote player and the
 *        Ready barrier that follows them.
 *
 * All methods take the current time explicitly so tests can drive the
 * timers deterministically.  Not thread-safe.
 */
class SaveSyncCoordinator final : public core::NonCopyable<SaveSyncCoordinator>
{
public:
    SaveSyncCoordinator(core::u8 playerCount, const SyncConfig &config);

    /**
     * @brief Creates the streams and returns the initial Announces.
     *
     * @param localPlayer Our player index, below the player count.
     * @param localSave   Our save, std::nullopt if we have none.
     */
    [[nodiscard]] core::Expected<std::vector<OutgoingPacket>>
    startSync(core::u8 localPlayer, std::optional<core::Bytes> localSave, TimePoint now);

    /** @brief Routes one received datagram. */
    SyncResult handlePacket(std::span<const core::byte> bytes, TimePoint now);

    /** @brief Retransmit timers, periodic acks, Ready resend, global timeout. */
    SyncResult tick(TimePoint now);

    /** @brief Hands over every datagram queued since the last call. */
    [[nodiscard]] std::vector<OutgoingPacket> drainOutgoing();

    /**
     * @brief Cancels the whole sync and tells the peers.
     *
     * Every stream becomes Failed and partial buffers are dropped.
     */
    void abort(SyncError error);

    /**
     * @brief Writes every player's save into its slot.
     *
     * Repeated calls write the same table.
     *
     * @return kInvalidState unless the sync is Complete.
     */
    [[nodiscard]] core::Expected<void> populate(save::SaveSlots &slots);

    [[nodiscard]] SyncResult result()      const noexcept { return _result; }
    [[nodiscard]] bool       readySent()   const noexcept { return _readySent; }
    [[nodiscard]] bool       readyFrom(core::u8 player) const noexcept;
    [[nodiscard]] core::u8   localPlayer() const noexcept { return _localPlayer; }
    [[nodiscard]] core::u8   playerCount() const noexcept { return _playerCount; }

    [[nodiscard]] const ArqSender   *sender(core::u8 player)   const noexcept;
    [[nodiscard]] const ArqReceiver *receiver(core::u8 player) const noexcept;

private:
    void       queue(core::u8 target, const protocol::TransferPacket &packet);
    void       collectStreams();
    void       sendReady(core::u8 target, TimePoint now);
    SyncResult evaluate(TimePoint now);
    SyncResult failLocally(SyncError error);

    [[nodiscard]] bool isRemote(core::u8 player) const noexcept;

    core::u8   _playerCount;
    SyncConfig _config;
    core::u8   _localPlayer{0};
    bool       _started{false};

    std::shared_ptr<const core::Bytes> _localSave;

    std::array<std::unique_ptr<ArqSender>, core::kMaxPlayers>   _senders;
    std::array<std::unique_ptr<ArqReceiver>, core::kMaxPlayers> _receivers;
    std::array<bool, core::kMaxPlayers>                         _readyFrom{};

    bool      _readySent{false};
    TimePoint _lastReadySent{};
    TimePoint _startedAt{};

    SyncResult                  _result;
    std::vector<OutgoingPacket> _outgoing;
};

} // namespace cinder::net::sync

#endif // CINDER_NET_SYNC_SAVESYNCCOORDINATOR_HPP
