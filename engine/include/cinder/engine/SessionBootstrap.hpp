/**
 * @file SessionBootstrap.hpp
 * @brief Blocking pre-match save synchronization over a transport.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_ENGINE_SESSIONBOOTSTRAP_HPP
    #define CINDER_ENGINE_SESSIONBOOTSTRAP_HPP

#include <cinder/engine/Config.hpp>
#include <cinder/core/Types.hpp>
#include <cinder/core/Expected.hpp>
#include <cinder/core/NonCopyable.hpp>
#include <cinder/net/sync/SaveSyncCoordinator.hpp>
#include <cinder/net/transport/ITransport.hpp>
#include <cinder/save/SaveSlots.hpp>

#include <optional>
#include <vector>

namespace cinder::engine {

/**
 * @class SessionBootstrap
 * @brief Drives a SaveSyncCoordinator from a transport until every player
 *        holds the same saves.
 *
 * run() blocks the caller for at most the configured sync timeout (plus a
 * short linger answering late packets).  begin() / poll() / finish() expose
 * the same loop one step at a time.
 */
class SessionBootstrap final : public core::NonCopyable<SessionBootstrap>
{
public:
    /**
     * @param config    Session configuration.
     * @param transport Open transport; not owned.
     * @param peers     Opaque transport address of each player, indexed by
     *                  player; the local entry is ignored.
     */
    SessionBootstrap(Config config, net::transport::ITransport &transport, std::vector<const void *> peers);

    /**
     * @brief Synchronizes and returns the populated slot table.
     *
     * On failure the error message is the human-readable reason.
     */
    [[nodiscard]] core::Expected<save::SaveSlots> run(std::optional<core::Bytes> localSave);

    [[nodiscard]] core::Expected<void> begin(std::optional<core::Bytes> localSave, net::sync::TimePoint now);

    /** @brief One receive / handle / tick / send pass. */
    net::sync::SyncResult poll(net::sync::TimePoint now);

    /**
     * @brief Populated slots once complete, the failure reason otherwise.
     *
     * The configured save mode is applied to the populated player slots.
     */
    [[nodiscard]] core::Expected<save::SaveSlots> finish();

    [[nodiscard]] const net::sync::SaveSyncCoordinator &coordinator() const noexcept { return _coordinator; }

private:
    void dispatch(const std::vector<net::sync::OutgoingPacket> &packets);
    void sendTo(core::u8 player, const core::Bytes &bytes);

    Config                          _config;
    net::transport::ITransport     &_transport;
    std::vector<const void *>       _peers;
    net::sync::SaveSyncCoordinator  _coordinator;
    core::Bytes                     _receiveBuffer;
};

} // namespace cinder::engine

#endif // CINDER_ENGINE_SESSIONBOOTSTRAP_HPP
