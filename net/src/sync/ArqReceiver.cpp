/**
 * @file ArqReceiver.cpp
 * @brief ArqReceiver implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/sync/ArqReceiver.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Log.hpp>
#include <cinder/math/StateHash.hpp>

#include <algorithm>
#include <format>
#include <iterator>

namespace cinder::net::sync {

ArqReceiver::ArqReceiver(core::u8 localPlayer, core::u8 remotePlayer, const SyncConfig &config)
    : _localPlayer{localPlayer}
    , _remotePlayer{remotePlayer}
    , _config{config}
{
}

void ArqReceiver::start(TimePoint now)
{
    if (_state != StreamState::Idle)
    {
        return;
    }
    _state        = StreamState::Announcing;
    _lastActivity = now;
    _lastAckSent  = now;
}

void ArqReceiver::onAnnounce(const protocol::AnnouncePacket &announce, TimePoint now)
{
    if (_state == StreamState::Idle || _state == StreamState::Failed)
    {
        return;
    }
    _lastActivity = now;

    if (_announced)
    {
        if (announce.totalLength != _totalLength || announce.hash != _hash)
        {
            core::Log::warn("Arq", std::format("player {} changed its announce mid-transfer", _remotePlayer));
            fail(protocol::SyncError::ProtocolError);
            return;
        }
        // Our ack was lost; repeat whichever answer is current.
        sendControl(_state == StreamState::Complete ? protocol::kAckVerified : protocol::kAckAnnounced);
        return;
    }

    if (announce.totalLength > core::kMaxSaveSize)
    {
        core::Log::warn("Arq", std::format("player {} announced {} bytes, limit is {}",
                                           _remotePlayer, announce.totalLength, core::kMaxSaveSize));
        fail(protocol::SyncError::TooLarge);
        return;
    }

    _announced   = true;
    _totalLength = announce.totalLength;
    _hash        = announce.hash;
    _absent      = announce.totalLength == 0 && announce.hash == protocol::kAbsentSaveHash;
    _totalChunks = static_cast<core::u16>((_totalLength + core::kChunkSize - 1) / core::kChunkSize);
    _buffer.assign(_totalLength, core::byte{0});
    _filled.assign(_totalChunks, false);
    _filledCount = 0;
    _state       = StreamState::Transferring;

    core::Log::debug("Arq", std::format("player {} announced {} bytes in {} chunks",
                                        _remotePlayer, _totalLength, _totalChunks));
    sendControl(protocol::kAckAnnounced);

    if (_totalChunks == 0)
    {
        verify(now);
    }
}

void ArqReceiver::onData(const protocol::DataPacket &data, TimePoint now)
{
    switch (_state)
    {
    case StreamState::Idle:
    case StreamState::Failed:
        return;
    case StreamState::Announcing:
        // Data cannot be validated before the Announce; the sender
        // retransmits it anyway.
        core::Log::debug("Arq", std::format("dropping chunk from player {} before its announce", _remotePlayer));
        _lastActivity = now;
        return;
    case StreamState::Complete:
        _lastActivity = now;
        sendControl(protocol::kAckVerified);
        return;
    default:
        break;
    }

    _lastActivity = now;

    if (data.totalChunks != _totalChunks || data.chunkIndex >= _totalChunks
        || data.payload.size() != expectedLength(data.chunkIndex))
    {
        core::Log::warn("Arq", std::format("player {} sent chunk {}/{} ({} bytes) inconsistent with its announce",
                                           _remotePlayer, data.chunkIndex, data.totalChunks, data.payload.size()));
        fail(protocol::SyncError::ProtocolError);
        return;
    }

    _window.record(data.sequence);

    if (!_filled[data.chunkIndex])
    {
        const auto offset = static_cast<std::ptrdiff_t>(data.chunkIndex) * static_cast<std::ptrdiff_t>(core::kChunkSize);
        std::ranges::copy(data.payload, _buffer.begin() + offset);
        _filled[data.chunkIndex] = true;
        ++_filledCount;
    }

    sendAck();

    if (_filledCount == _totalChunks)
    {
        verify(now);
        return;
    }

    // The last chunk while others are missing after a resend request is the
    // sender's verdict probe: our kAckResend was lost.
    if (_hashRetries > 0 && data.chunkIndex + 1 == _totalChunks)
    {
        sendControl(protocol::kAckResend);
    }
}

void ArqReceiver::tick(TimePoint now)
{
    if (_state != StreamState::Announcing && _state != StreamState::Transferring)
    {
        return;
    }
    if (now - _lastActivity >= _config.peerSilenceTimeout)
    {
        fail(protocol::SyncError::Disconnected);
        return;
    }
    if (_window.any() && now - _lastAckSent >= _config.ackInterval)
    {
        sendAck();
        _lastAckSent = now;
    }
}

void ArqReceiver::fail(protocol::SyncError error)
{
    if (_state == StreamState::Failed)
    {
        return;
    }
    _state   = StreamState::Failed;
    _failure = error;
    _buffer.clear();
    _filled.clear();
    _filledCount = 0;
    core::Log::warn("Arq", std::format("receive from player {} failed: {}",
                                       _remotePlayer, protocol::describe(error)));
}

void ArqReceiver::takeOutgoing(std::vector<protocol::TransferPacket> &out)
{
    std::ranges::move(_outbox, std::back_inserter(out));
    _outbox.clear();
}

std::optional<core::Bytes> ArqReceiver::result() const
{
    if (_state != StreamState::Complete || _absent)
    {
        return std::nullopt;
    }
    return _buffer;
}

void ArqReceiver::sendAck()
{
    _outbox.emplace_back(protocol::AckPacket{_localPlayer, _window.last(), _window.bits()});
}

void ArqReceiver::sendControl(core::u32 verdict)
{
    _outbox.emplace_back(protocol::AckPacket{_localPlayer, protocol::kControlSequence, verdict});
}

void ArqReceiver::verify(TimePoint now)
{
    _state = StreamState::Verifying;

    if (_absent)
    {
        complete();
        return;
    }

    if (math::contentHash(_buffer) == _hash)
    {
        complete();
        return;
    }

    // An empty buffer cannot improve with a resend.
    if (_hashRetries >= _config.maxHashRetries || _totalChunks == 0)
    {
        fail(protocol::SyncError::HashMismatch);
        return;
    }

    ++_hashRetries;
    core::Log::warn("Arq", std::format("save from player {} failed verification, requesting resend {}/{}",
                                       _remotePlayer, _hashRetries, _config.maxHashRetries));
    std::ranges::fill(_buffer, core::byte{0});
    _filled.assign(_totalChunks, false);
    _filledCount = 0;
    _window.reset();
    _lastActivity = now;
    _state = StreamState::Transferring;
    sendControl(protocol::kAckResend);
}

void ArqReceiver::complete()
{
    _state = StreamState::Complete;
    core::Log::debug("Arq", std::format("save from player {} verified ({} bytes)", _remotePlayer, _totalLength));
    sendControl(protocol::kAckVerified);
}

core::usize ArqReceiver::expectedLength(core::u16 index) const noexcept
{
    const auto offset = static_cast<core::usize>(index) * core::kChunkSize;
    return std::min(core::kChunkSize, static_cast<core::usize>(_totalLength) - offset);
}

} // namespace cinder::net::sync
