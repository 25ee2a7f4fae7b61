/**
 * @file SyncConfig.hpp
 * @brief Timing and retry budget of the save synchronization.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_SYNC_SYNCCONFIG_HPP
    #define CINDER_NET_SYNC_SYNCCONFIG_HPP

#include <cinder/core/Types.hpp>

#include <chrono>

namespace cinder::net::sync {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

/**
 * @struct SyncConfig
 * @brief Values consumed by the ARQ streams and the coordinator.
 *
 * Built by engine::Config::syncConfig(); the defaults match the console's
 * shipping values.
 */
struct SyncConfig
{
    Millis    initialRetransmitTimeout{100};
    Millis    maxRetransmitTimeout{2000};
    core::u32 maxRetransmits{8};
    core::u32 maxHashRetries{2};
    core::u32 windowSize{32};           ///< Chunks in flight; capped at 32 (one SACK).
    Millis    ackInterval{50};
    Millis    readyInterval{100};
    Millis    peerSilenceTimeout{5000};
    Millis    syncTimeout{15000};
};

} // namespace cinder::net::sync

#endif // CINDER_NET_SYNC_SYNCCONFIG_HPP
