/**
 * @file ArqSender.cpp
 * @brief ArqSender implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/sync/ArqSender.hpp>
#include <cinder/net/sync/SequenceWindow.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Log.hpp>
#include <cinder/math/StateHash.hpp>

#include <algorithm>
#include <format>
#include <iterator>

namespace cinder::net::sync {

ArqSender::ArqSender(core::u8 localPlayer, core::u8 remotePlayer,
                     std::shared_ptr<const core::Bytes> save, const SyncConfig &config)
    : _localPlayer{localPlayer}
    , _remotePlayer{remotePlayer}
    , _save{std::move(save)}
    , _config{config}
    , _window{std::clamp<core::u32>(config.windowSize, 1u, kAckBits)}
{
    if (_save)
    {
        _totalLength = static_cast<core::u32>(_save->size());
        _hash        = math::contentHash(*_save);
        _totalChunks = static_cast<core::u16>((_save->size() + core::kChunkSize - 1) / core::kChunkSize);
    }
    else
    {
        _hash = protocol::kAbsentSaveHash;
    }
    _chunks.resize(_totalChunks);
}

// ========================================================================== //
//  Public                                                                    //
// ========================================================================== //

void ArqSender::start(TimePoint now)
{
    if (_state != StreamState::Idle)
    {
        return;
    }
    _state              = StreamState::Announcing;
    _controlTimeout     = _config.initialRetransmitTimeout;
    _controlDeadline    = now + _controlTimeout;
    _controlRetransmits = 0;
    sendAnnounce();
}

void ArqSender::onAck(const protocol::AckPacket &ack, TimePoint now)
{
    if (isTerminal(_state) || _state == StreamState::Idle)
    {
        return;
    }

    // Any ack proves the Announce arrived.
    if (_state == StreamState::Announcing)
    {
        _state = StreamState::Transferring;
    }

    if (ack.lastSequence == protocol::kControlSequence)
    {
        handleControl(ack.ackBits, now);
    }
    else
    {
        acknowledge(ack.lastSequence);
        for (core::u32 i = 0; i < kAckBits; ++i)
        {
            if (ack.ackBits & (1u << i))
            {
                acknowledge(static_cast<core::u16>(ack.lastSequence - 1 - i));
            }
        }
    }

    if (_state == StreamState::Transferring)
    {
        if (_ackedCount == _totalChunks)
        {
            enterVerifying(now);
        }
        else
        {
            pump(now);
        }
    }
}

void ArqSender::tick(TimePoint now)
{
    switch (_state)
    {
    case StreamState::Announcing:
    case StreamState::Verifying:
        checkControlTimer(now);
        break;
    case StreamState::Transferring:
        checkChunkTimers(now);
        if (_state == StreamState::Transferring)
        {
            pump(now);
        }
        break;
    default:
        break;
    }
}

void ArqSender::fail(protocol::SyncError error)
{
    if (_state == StreamState::Failed)
    {
        return;
    }
    _state   = StreamState::Failed;
    _failure = error;
    core::Log::warn("Arq", std::format("send to player {} failed: {}",
                                       _remotePlayer, protocol::describe(error)));
}

void ArqSender::takeOutgoing(std::vector<protocol::TransferPacket> &out)
{
    std::ranges::move(_outbox, std::back_inserter(out));
    _outbox.clear();
}

// ========================================================================== //
//  Private                                                                   //
// ========================================================================== //

void ArqSender::sendAnnounce()
{
    _outbox.emplace_back(protocol::AnnouncePacket{_localPlayer, _totalLength, _hash});
}

void ArqSender::sendChunk(core::u16 index, TimePoint now)
{
    const core::u16 sequence = _nextSequence;
    _nextSequence = nextSequence(_nextSequence);
    _sequenceToChunk[sequence] = index;

    auto &slot    = _chunks[index];
    slot.inFlight = true;
    slot.deadline = now + slot.timeout;

    const auto offset = static_cast<core::usize>(index) * core::kChunkSize;
    const auto first  = _save->begin() + static_cast<std::ptrdiff_t>(offset);

    protocol::DataPacket packet;
    packet.player      = _localPlayer;
    packet.sequence    = sequence;
    packet.chunkIndex  = index;
    packet.totalChunks = _totalChunks;
    packet.payload.assign(first, first + chunkLength(index));
    _outbox.emplace_back(std::move(packet));
}

void ArqSender::pump(TimePoint now)
{
    core::u32 inFlight = 0;
    for (const auto &slot : _chunks)
    {
        if (slot.inFlight && !slot.acked)
        {
            ++inFlight;
        }
    }

    for (core::u16 i = 0; i < _totalChunks && inFlight < _window; ++i)
    {
        auto &slot = _chunks[i];
        if (slot.acked || slot.inFlight)
        {
            continue;
        }
        slot.timeout     = _config.initialRetransmitTimeout;
        slot.retransmits = 0;
        sendChunk(i, now);
        ++inFlight;
    }
}

void ArqSender::acknowledge(core::u16 sequence)
{
    const auto it = _sequenceToChunk.find(sequence);
    if (it == _sequenceToChunk.end())
    {
        return;
    }
    auto &slot = _chunks[it->second];
    _sequenceToChunk.erase(it);
    if (slot.acked)
    {
        return;
    }
    slot.acked    = true;
    slot.inFlight = false;
    ++_ackedCount;
}

void ArqSender::handleControl(core::u32 verdict, TimePoint now)
{
    switch (verdict)
    {
    case protocol::kAckAnnounced:
        break;
    case protocol::kAckVerified:
        _state = StreamState::Complete;
        core::Log::debug("Arq", std::format("player {} verified our save ({} bytes)",
                                            _remotePlayer, _totalLength));
        break;
    case protocol::kAckResend:
        restart(now);
        break;
    default:
        core::Log::debug("Arq", std::format("ignoring unknown control ack {:#x} from player {}",
                                            verdict, _remotePlayer));
        break;
    }
}

void ArqSender::checkChunkTimers(TimePoint now)
{
    for (core::u16 i = 0; i < _totalChunks; ++i)
    {
        auto &slot = _chunks[i];
        if (!slot.inFlight || slot.acked || now < slot.deadline)
        {
            continue;
        }
        if (slot.retransmits >= _config.maxRetransmits)
        {
            fail(protocol::SyncError::Timeout);
            return;
        }
        ++slot.retransmits;
        ++_retransmits;
        slot.timeout = backoff(slot.timeout);
        sendChunk(i, now);
    }
}

void ArqSender::checkControlTimer(TimePoint now)
{
    if (now < _controlDeadline)
    {
        return;
    }
    if (_controlRetransmits >= _config.maxRetransmits)
    {
        fail(protocol::SyncError::Timeout);
        return;
    }
    ++_controlRetransmits;
    ++_retransmits;
    _controlTimeout  = backoff(_controlTimeout);
    _controlDeadline = now + _controlTimeout;

    // The verdict probe reuses the last chunk; a receiver that already
    // verified answers it with kAckVerified.
    if (_state == StreamState::Verifying && _totalChunks > 0)
    {
        const core::u16 last = static_cast<core::u16>(_totalChunks - 1);
        _chunks[last].timeout = _controlTimeout;
        sendChunk(last, now);
        _chunks[last].inFlight = false;
    }
    else
    {
        sendAnnounce();
    }
}

void ArqSender::enterVerifying(TimePoint now)
{
    _state              = StreamState::Verifying;
    _controlTimeout     = _config.initialRetransmitTimeout;
    _controlDeadline    = now + _controlTimeout;
    _controlRetransmits = 0;
}

void ArqSender::restart(TimePoint now)
{
    // While Transferring a resend is already under way.
    if (_state != StreamState::Verifying)
    {
        return;
    }
    ++_fullResends;
    core::Log::warn("Arq", std::format("player {} rejected our save hash, resending all {} chunks",
                                       _remotePlayer, _totalChunks));

    for (auto &slot : _chunks)
    {
        slot = ChunkSlot{};
    }
    _ackedCount = 0;
    // Acks still in flight from the previous round must not count.
    _sequenceToChunk.clear();
    _state = StreamState::Transferring;

    if (_totalChunks == 0)
    {
        enterVerifying(now);
        return;
    }
    pump(now);
}

Millis ArqSender::backoff(Millis current) const noexcept
{
    return std::min(current * 2, _config.maxRetransmitTimeout);
}

core::u16 ArqSender::chunkLength(core::u16 index) const noexcept
{
    const auto offset = static_cast<core::usize>(index) * core::kChunkSize;
    return static_cast<core::u16>(std::min(core::kChunkSize, _save->size() - offset));
}

} // namespace cinder::net::sync
