/**
 * @file Constants.hpp
 * @brief Console-wide compile-time constants.
 *
 * Save limits and wire sizes are centralised here so that the slot model,
 * the transfer codec and the persistence layer agree on the same limits.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_CORE_CONSTANTS_HPP
    #define CINDER_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace cinder::core {

inline constexpr u32   kMaxPlayers            = 4;
inline constexpr u32   kMaxSaveSlots          = 8;
inline constexpr usize kMaxSaveSize           = 64 * 1024;
inline constexpr u32   kPersistentSlots       = 4;

inline constexpr usize kChunkSize             = 8 * 1024;

inline constexpr u16   kDefaultPort           = 7777;
inline constexpr usize kMaxDatagramSize       = kChunkSize + 64;

static_assert(kMaxPlayers <= kMaxSaveSlots, "every player owns one slot");

} // namespace cinder::core

#endif // CINDER_CORE_CONSTANTS_HPP
