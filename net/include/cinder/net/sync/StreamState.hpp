/**
 * @file StreamState.hpp
 * @brief Lifecycle of one save-data stream.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_SYNC_STREAMSTATE_HPP
    #define CINDER_NET_SYNC_STREAMSTATE_HPP

#include <cinder/core/Types.hpp>

#include <string_view>

namespace cinder::net::sync {

/**
 * @enum StreamState
 * @brief Idle -> Announcing -> Transferring -> Verifying -> Complete, or Failed.
 *
 * For a sender, Announcing means the Announce is not acknowledged yet and
 * Verifying means every chunk is acknowledged but the receiver's verdict
 * has not arrived.  For a receiver, Announcing means it is waiting for the
 * Announce and Verifying is the hash check over the reassembled buffer.
 * Complete and Failed are terminal.
 */
enum class StreamState : core::u8
{
    Idle,
    Announcing,
    Transferring,
    Verifying,
    Complete,
    Failed
};

[[nodiscard]] inline constexpr std::string_view toString(StreamState state) noexcept
{
    switch (state)
    {
    case StreamState::Idle:         return "Idle";
    case StreamState::Announcing:   return "Announcing";
    case StreamState::Transferring: return "Transferring";
    case StreamState::Verifying:    return "Verifying";
    case StreamState::Complete:     return "Complete";
    case StreamState::Failed:       return "Failed";
    }
    return "?";
}

[[nodiscard]] inline constexpr bool isTerminal(StreamState state) noexcept
{
    return state == StreamState::Complete || state == StreamState::Failed;
}

} // namespace cinder::net::sync

#endif // CINDER_NET_SYNC_STREAMSTATE_HPP
