/**
 * @file Config.hpp
 * @brief Session configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_ENGINE_CONFIG_HPP
    #define CINDER_ENGINE_CONFIG_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Expected.hpp>
#include <cinder/net/sync/SyncConfig.hpp>
#include <cinder/save/SaveStore.hpp>

#include <chrono>
#include <filesystem>

namespace cinder::engine {

/** @brief Immutable session configuration. */
class Config
{
public:
    using Millis = std::chrono::milliseconds;

    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& playerCount(core::u8 n) noexcept;
        Builder& localPlayer(core::u8 index) noexcept;
        Builder& initialRetransmitTimeout(Millis value) noexcept;
        Builder& maxRetransmitTimeout(Millis value) noexcept;
        Builder& maxRetransmits(core::u32 n) noexcept;
        Builder& maxHashRetries(core::u32 n) noexcept;
        Builder& windowSize(core::u32 chunks) noexcept;
        Builder& ackInterval(Millis value) noexcept;
        Builder& readyInterval(Millis value) noexcept;
        Builder& peerSilenceTimeout(Millis value) noexcept;
        Builder& syncTimeout(Millis value) noexcept;
        Builder& writerPollInterval(Millis value) noexcept;
        Builder& pollSleep(Millis value) noexcept;
        Builder& saveDirectory(std::filesystem::path dir);
        Builder& saveConfig(save::SaveConfig config);

        [[nodiscard]] Config build() const;

    private:
        core::u8              _playerCount{2};
        core::u8              _localPlayer{0};
        net::sync::SyncConfig _sync{};
        Millis                _writerPollInterval{50};
        Millis                _pollSleep{1};
        std::filesystem::path _saveDirectory{"saves"};
        save::SaveConfig      _saveConfig{};
    };

    /**
     * @brief Rejects player layouts and windows the protocol cannot carry.
     */
    [[nodiscard]] core::Expected<void> validate() const;

    [[nodiscard]] core::u8  playerCount()     const noexcept { return _playerCount; }
    [[nodiscard]] core::u8  localPlayer()     const noexcept { return _localPlayer; }
    [[nodiscard]] core::u32 localPlayerMask() const noexcept { return 1u << _localPlayer; }

    [[nodiscard]] const net::sync::SyncConfig &syncConfig() const noexcept { return _sync; }

    [[nodiscard]] Millis writerPollInterval() const noexcept { return _writerPollInterval; }
    [[nodiscard]] Millis pollSleep()          const noexcept { return _pollSleep; }

    [[nodiscard]] const std::filesystem::path &saveDirectory() const noexcept { return _saveDirectory; }

    /** @brief Host override applied to the player slots once the saves are exchanged. */
    [[nodiscard]] const save::SaveConfig &saveConfig() const noexcept { return _saveConfig; }

private:
    friend class Builder;

    core::u8              _playerCount{2};
    core::u8              _localPlayer{0};
    net::sync::SyncConfig _sync{};
    Millis                _writerPollInterval{50};
    Millis                _pollSleep{1};
    std::filesystem::path _saveDirectory{"saves"};
    save::SaveConfig      _saveConfig{};
};

} // namespace cinder::engine

#endif // CINDER_ENGINE_CONFIG_HPP
