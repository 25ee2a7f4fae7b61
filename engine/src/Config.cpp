/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/engine/Config.hpp>
#include <cinder/net/sync/SequenceWindow.hpp>

#include <format>

namespace cinder::engine {

Config::Builder& Config::Builder::playerCount(core::u8 n) noexcept
{
    _playerCount = n;
    return *this;
}

Config::Builder& Config::Builder::localPlayer(core::u8 index) noexcept
{
    _localPlayer = index;
    return *this;
}

Config::Builder& Config::Builder::initialRetransmitTimeout(Millis value) noexcept
{
    _sync.initialRetransmitTimeout = value;
    return *this;
}

Config::Builder& Config::Builder::maxRetransmitTimeout(Millis value) noexcept
{
    _sync.maxRetransmitTimeout = value;
    return *this;
}

Config::Builder& Config::Builder::maxRetransmits(core::u32 n) noexcept
{
    _sync.maxRetransmits = n;
    return *this;
}

Config::Builder& Config::Builder::maxHashRetries(core::u32 n) noexcept
{
    _sync.maxHashRetries = n;
    return *this;
}

Config::Builder& Config::Builder::windowSize(core::u32 chunks) noexcept
{
    _sync.windowSize = chunks;
    return *this;
}

Config::Builder& Config::Builder::ackInterval(Millis value) noexcept
{
    _sync.ackInterval = value;
    return *this;
}

Config::Builder& Config::Builder::readyInterval(Millis value) noexcept
{
    _sync.readyInterval = value;
    return *this;
}

Config::Builder& Config::Builder::peerSilenceTimeout(Millis value) noexcept
{
    _sync.peerSilenceTimeout = value;
    return *this;
}

Config::Builder& Config::Builder::syncTimeout(Millis value) noexcept
{
    _sync.syncTimeout = value;
    return *this;
}

Config::Builder& Config::Builder::writerPollInterval(Millis value) noexcept
{
    _writerPollInterval = value;
    return *this;
}

Config::Builder& Config::Builder::pollSleep(Millis value) noexcept
{
    _pollSleep = value;
    return *this;
}

Config::Builder& Config::Builder::saveDirectory(std::filesystem::path dir)
{
    _saveDirectory = std::move(dir);
    return *this;
}

Config::Builder& Config::Builder::saveConfig(save::SaveConfig config)
{
    _saveConfig = std::move(config);
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg._playerCount        = _playerCount;
    cfg._localPlayer        = _localPlayer;
    cfg._sync               = _sync;
    cfg._writerPollInterval = _writerPollInterval;
    cfg._pollSleep          = _pollSleep;
    cfg._saveDirectory      = _saveDirectory;
    cfg._saveConfig         = _saveConfig;
    return cfg;
}

core::Expected<void> Config::validate() const
{
    if (_playerCount == 0 || _playerCount > core::kMaxPlayers)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("player count {} outside 1..{}", _playerCount, core::kMaxPlayers));
    }
    if (_localPlayer >= _playerCount)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("local player {} outside a {}-player session", _localPlayer, _playerCount));
    }
    if (_sync.windowSize == 0 || _sync.windowSize > net::sync::kAckBits)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("window of {} chunks, must be 1..{}", _sync.windowSize, net::sync::kAckBits));
    }
    if (_sync.initialRetransmitTimeout <= Millis::zero()
        || _sync.maxRetransmitTimeout < _sync.initialRetransmitTimeout)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "retransmit timeouts must satisfy 0 < initial <= max");
    }
    return {};
}

} // namespace cinder::engine
