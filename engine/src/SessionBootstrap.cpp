/**
 * @file SessionBootstrap.cpp
 * @brief SessionBootstrap implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/engine/SessionBootstrap.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Log.hpp>
#include <cinder/net/protocol/TransferPacket.hpp>

#include <format>
#include <thread>

namespace cinder::engine {

SessionBootstrap::SessionBootstrap(Config config, net::transport::ITransport &transport,
                                   std::vector<const void *> peers)
    : _config{std::move(config)}
    , _transport{transport}
    , _peers{std::move(peers)}
    , _coordinator{_config.playerCount(), _config.syncConfig()}
    , _receiveBuffer(core::kMaxDatagramSize)
{
}

core::Expected<save::SaveSlots> SessionBootstrap::run(std::optional<core::Bytes> localSave)
{
    using net::sync::Clock;

    CINDER_TRY_VOID(begin(std::move(localSave), Clock::now()));

    for (;;)
    {
        const auto result = poll(Clock::now());
        if (!result.isError() && !result.isComplete())
        {
            std::this_thread::sleep_for(_config.pollSleep());
            continue;
        }
        if (result.isError())
        {
            return finish();
        }
        break;
    }

    // Peers that lost our last Ready or ack still need an answer.
    const auto lingerUntil = Clock::now() + 2 * _config.syncConfig().readyInterval;
    while (Clock::now() < lingerUntil)
    {
        (void) poll(Clock::now());
        std::this_thread::sleep_for(_config.pollSleep());
    }

    return finish();
}

core::Expected<void> SessionBootstrap::begin(std::optional<core::Bytes> localSave, net::sync::TimePoint now)
{
    CINDER_TRY_VOID(_config.validate());

    if (_peers.size() < _config.playerCount())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("{} peer addresses for {} players", _peers.size(), _config.playerCount()));
    }
    for (core::u8 player = 0; player < _config.playerCount(); ++player)
    {
        if (player != _config.localPlayer() && _peers[player] == nullptr)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("no address for player {}", player));
        }
    }

    core::Log::info("Bootstrap", std::format("synchronizing saves over {}", _transport.name()));

    dispatch(CINDER_TRY(_coordinator.startSync(_config.localPlayer(), std::move(localSave), now)));
    return {};
}

net::sync::SyncResult SessionBootstrap::poll(net::sync::TimePoint now)
{
    for (;;)
    {
        auto received = _transport.receive(_receiveBuffer, nullptr);
        if (!received)
        {
            core::Log::warn("Bootstrap", received.error().message());
            break;
        }
        if (*received == 0)
        {
            break;
        }

        const std::span<const core::byte> datagram{_receiveBuffer.data(), *received};
        if (!net::protocol::peekKind(datagram))
        {
            core::Log::debug("Bootstrap", "ignoring non save-sync datagram");
            continue;
        }
        (void) _coordinator.handlePacket(datagram, now);
    }

    const auto result = _coordinator.tick(now);
    dispatch(_coordinator.drainOutgoing());
    return result;
}

core::Expected<save::SaveSlots> SessionBootstrap::finish()
{
    const auto result = _coordinator.result();
    if (result.isError())
    {
        const auto reason = std::format("save synchronization failed: {} (reported by player {})",
                                        net::protocol::describe(result.error), result.origin);
        core::Log::error("Bootstrap", reason);
        return core::makeError(net::protocol::toErrorCode(result.error), reason);
    }

    save::SaveSlots slots;
    CINDER_TRY_VOID(_coordinator.populate(slots));

    const auto &saveConfig = _config.saveConfig();
    if (saveConfig.mode != save::SaveMode::PerPlayer)
    {
        core::Log::info("Bootstrap", std::format("applying {} save mode", save::toString(saveConfig.mode)));
    }
    save::applySaveMode(slots, saveConfig);
    return slots;
}

void SessionBootstrap::dispatch(const std::vector<net::sync::OutgoingPacket> &packets)
{
    for (const auto &packet : packets)
    {
        if (packet.target == net::sync::kBroadcast)
        {
            for (core::u8 player = 0; player < _config.playerCount(); ++player)
            {
                sendTo(player, packet.bytes);
            }
        }
        else
        {
            sendTo(packet.target, packet.bytes);
        }
    }
}

void SessionBootstrap::sendTo(core::u8 player, const core::Bytes &bytes)
{
    if (player == _config.localPlayer() || player >= _peers.size())
    {
        return;
    }
    // A failed send is indistinguishable from loss; the ARQ timers cover it.
    if (auto sent = _transport.send(bytes, _peers[player]); !sent)
    {
        core::Log::debug("Bootstrap", std::format("send to player {} failed: {}", player, sent.error().message()));
    }
}

} // namespace cinder::engine
