/**
 * @file SaveSyncCoordinator.cpp
 * @brief SaveSyncCoordinator implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/sync/SaveSyncCoordinator.hpp>
#include <cinder/core/Log.hpp>

#include <format>
#include <utility>

namespace cinder::net::sync {

namespace {

/** @brief Copies of a locally raised Error; it is never retransmitted. */
constexpr core::u32 kErrorRepeats = 3;

} // namespace

SaveSyncCoordinator::SaveSyncCoordinator(core::u8 playerCount, const SyncConfig &config)
    : _playerCount{playerCount}
    , _config{config}
{
}

// ========================================================================== //
//  Public                                                                    //
// ========================================================================== //

core::Expected<std::vector<OutgoingPacket>>
SaveSyncCoordinator::startSync(core::u8 localPlayer, std::optional<core::Bytes> localSave, TimePoint now)
{
    if (_started)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "save sync already started");
    }
    if (_playerCount == 0 || _playerCount > core::kMaxPlayers)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("player count {} outside 1..{}", _playerCount, core::kMaxPlayers));
    }
    if (localPlayer >= _playerCount)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("local player {} outside a {}-player session", localPlayer, _playerCount));
    }
    if (localSave && localSave->size() > core::kMaxSaveSize)
    {
        return core::makeError(core::ErrorCode::kSaveTooLarge,
                               std::format("local save is {} bytes, limit is {}", localSave->size(), core::kMaxSaveSize));
    }

    _started     = true;
    _localPlayer = localPlayer;
    _startedAt   = now;
    if (localSave)
    {
        _localSave = std::make_shared<const core::Bytes>(std::move(*localSave));
    }

    for (core::u8 player = 0; player < _playerCount; ++player)
    {
        if (player == _localPlayer)
        {
            continue;
        }
        _senders[player]   = std::make_unique<ArqSender>(_localPlayer, player, _localSave, _config);
        _receivers[player] = std::make_unique<ArqReceiver>(_localPlayer, player, _config);
        _senders[player]->start(now);
        _receivers[player]->start(now);
    }

    core::Log::info("SaveSync", std::format("player {}/{} syncing {} save",
                                            _localPlayer, _playerCount,
                                            _localSave ? std::format("a {}-byte", _localSave->size()) : "no"));

    collectStreams();
    (void) evaluate(now);
    return drainOutgoing();
}

SyncResult SaveSyncCoordinator::handlePacket(std::span<const core::byte> bytes, TimePoint now)
{
    if (!_started || _result.isError())
    {
        return _result;
    }

    auto decoded = protocol::decode(bytes);
    if (!decoded)
    {
        core::Log::debug("SaveSync", std::format("dropping datagram: {}", decoded.error().message()));
        return _result;
    }

    const core::u8 from = protocol::senderOf(*decoded);
    if (!isRemote(from))
    {
        core::Log::debug("SaveSync", std::format("dropping packet claiming to be from player {}", from));
        return _result;
    }

    const bool wasComplete = _result.isComplete();

    if (const auto *announce = std::get_if<protocol::AnnouncePacket>(&*decoded))
    {
        _receivers[from]->onAnnounce(*announce, now);
    }
    else if (const auto *data = std::get_if<protocol::DataPacket>(&*decoded))
    {
        _receivers[from]->onData(*data, now);
    }
    else if (const auto *ack = std::get_if<protocol::AckPacket>(&*decoded))
    {
        _senders[from]->onAck(*ack, now);
    }
    else if (std::holds_alternative<protocol::ReadyPacket>(*decoded))
    {
        _readyFrom[from] = true;
        // Only a finished peer answers: two waiting peers would otherwise
        // bounce Ready between them forever.
        if (wasComplete)
        {
            sendReady(from, now);
        }
    }
    else if (const auto *error = std::get_if<protocol::ErrorPacket>(&*decoded))
    {
        core::Log::warn("SaveSync", std::format("player {} aborted the sync: {}",
                                                from, protocol::describe(error->code)));
        for (core::u8 player = 0; player < _playerCount; ++player)
        {
            if (isRemote(player))
            {
                _senders[player]->fail(error->code);
                _receivers[player]->fail(error->code);
            }
        }
        _result = SyncResult::failed(error->code, from);
        return _result;
    }

    collectStreams();
    return evaluate(now);
}

SyncResult SaveSyncCoordinator::tick(TimePoint now)
{
    if (!_started || _result.isError())
    {
        return _result;
    }

    if (!_result.isComplete() && now - _startedAt >= _config.syncTimeout)
    {
        core::Log::warn("SaveSync", std::format("no agreement after {} ms", _config.syncTimeout.count()));
        return failLocally(SyncError::Timeout);
    }

    for (core::u8 player = 0; player < _playerCount; ++player)
    {
        if (isRemote(player))
        {
            _senders[player]->tick(now);
            _receivers[player]->tick(now);
        }
    }
    collectStreams();

    if (_readySent && !_result.isComplete() && now - _lastReadySent >= _config.readyInterval)
    {
        sendReady(kBroadcast, now);
    }

    return evaluate(now);
}

std::vector<OutgoingPacket> SaveSyncCoordinator::drainOutgoing()
{
    return std::exchange(_outgoing, {});
}

void SaveSyncCoordinator::abort(SyncError error)
{
    if (!_started || _result.isError())
    {
        return;
    }
    (void) failLocally(error);
}

core::Expected<void> SaveSyncCoordinator::populate(save::SaveSlots &slots)
{
    if (!_result.isComplete())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "save sync has not completed");
    }

    for (core::u8 player = 0; player < _playerCount; ++player)
    {
        std::optional<core::Bytes> data;
        if (player == _localPlayer)
        {
            if (_localSave)
            {
                data = *_localSave;
            }
        }
        else
        {
            data = _receivers[player]->result();
        }
        CINDER_TRY_VOID(slots.assign(player, std::move(data)));
    }
    return {};
}

bool SaveSyncCoordinator::readyFrom(core::u8 player) const noexcept
{
    return player < core::kMaxPlayers && _readyFrom[player];
}

const ArqSender *SaveSyncCoordinator::sender(core::u8 player) const noexcept
{
    return player < core::kMaxPlayers ? _senders[player].get() : nullptr;
}

const ArqReceiver *SaveSyncCoordinator::receiver(core::u8 player) const noexcept
{
    return player < core::kMaxPlayers ? _receivers[player].get() : nullptr;
}

// ========================================================================== //
//  Private                                                                   //
// ========================================================================== //

void SaveSyncCoordinator::queue(core::u8 target, const protocol::TransferPacket &packet)
{
    _outgoing.push_back(OutgoingPacket{target, protocol::encode(packet)});
}

void SaveSyncCoordinator::collectStreams()
{
    std::vector<protocol::TransferPacket> packets;
    for (core::u8 player = 0; player < _playerCount; ++player)
    {
        if (!isRemote(player))
        {
            continue;
        }
        packets.clear();
        _senders[player]->takeOutgoing(packets);
        _receivers[player]->takeOutgoing(packets);
        for (const auto &packet : packets)
        {
            queue(player, packet);
        }
    }
}

void SaveSyncCoordinator::sendReady(core::u8 target, TimePoint now)
{
    queue(target, protocol::ReadyPacket{_localPlayer});
    if (target == kBroadcast)
    {
        _lastReadySent = now;
    }
}

SyncResult SaveSyncCoordinator::evaluate(TimePoint now)
{
    if (_result.isError())
    {
        return _result;
    }

    bool streamsDone = true;
    for (core::u8 player = 0; player < _playerCount; ++player)
    {
        if (!isRemote(player))
        {
            continue;
        }
        for (const auto failure : {_senders[player]->failure(), _receivers[player]->failure()})
        {
            if (failure)
            {
                return failLocally(*failure);
            }
        }
        streamsDone = streamsDone
                   && _senders[player]->state() == StreamState::Complete
                   && _receivers[player]->state() == StreamState::Complete;
    }

    if (_result.isComplete() || !streamsDone)
    {
        return _result;
    }

    if (!_readySent)
    {
        _readySent = true;
        sendReady(kBroadcast, now);
        core::Log::debug("SaveSync", "all streams verified, sending Ready");
    }

    for (core::u8 player = 0; player < _playerCount; ++player)
    {
        if (isRemote(player) && !_readyFrom[player])
        {
            return _result;
        }
    }

    _result = SyncResult::complete();
    core::Log::info("SaveSync", std::format("save sync complete across {} players", _playerCount));
    return _result;
}

SyncResult SaveSyncCoordinator::failLocally(SyncError error)
{
    for (core::u8 player = 0; player < _playerCount; ++player)
    {
        if (isRemote(player))
        {
            _senders[player]->fail(error);
            _receivers[player]->fail(error);
        }
    }
    for (core::u32 i = 0; i < kErrorRepeats; ++i)
    {
        queue(kBroadcast, protocol::ErrorPacket{error, _localPlayer});
    }
    _result = SyncResult::failed(error, _localPlayer);
    core::Log::error("SaveSync", std::format("save sync aborted: {}", protocol::describe(error)));
    return _result;
}

bool SaveSyncCoordinator::isRemote(core::u8 player) const noexcept
{
    return player < _playerCount && player != _localPlayer && _senders[player] != nullptr;
}

} // namespace cinder::net::sync
