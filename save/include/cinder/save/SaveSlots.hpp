/**
 * @file SaveSlots.hpp
 * @brief In-memory save slot table of one session.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_SAVE_SAVESLOTS_HPP
    #define CINDER_SAVE_SAVESLOTS_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Expected.hpp>

#include <array>
#include <optional>
#include <span>

namespace cinder::save {

/**
 * @enum GuestResult
 * @brief Status codes returned to guest code by save / erase.
 */
enum class GuestResult : core::u32
{
    Ok          = 0,
    InvalidSlot = 1,
    TooLarge    = 2,
    NotOwner    = 3
};

/** @brief Maps a write / erase outcome onto its guest code. */
[[nodiscard]] GuestResult toGuestResult(const core::Expected<void> &result) noexcept;

/**
 * @class SaveSlots
 * @brief kMaxSaveSlots optional buffers, the first kMaxPlayers owned by
 *        the player of the same index.
 *
 * write() and erase() validate slot, size and ownership before touching
 * anything.  assign() is the bootstrap path and skips ownership.
 */
class SaveSlots final
{
public:
    using Slot = std::optional<core::Bytes>;

    SaveSlots() = default;

    /**
     * @brief Stores @p data in @p slot on behalf of the players in @p localMask.
     * @return kSaveInvalidSlot, kSaveTooLarge or kSaveNotOwner on rejection.
     */
    [[nodiscard]] core::Expected<void> write(core::u32 slot, std::span<const core::byte> data, core::u32 localMask);

    /** @brief Empties @p slot; same validation as write() minus size. */
    [[nodiscard]] core::Expected<void> erase(core::u32 slot, core::u32 localMask);

    /** @brief Replaces @p slot wholesale, ownership not checked. */
    [[nodiscard]] core::Expected<void> assign(core::u32 slot, Slot data);

    /**
     * @brief Guest load: copies min(len, dst.size()) bytes.
     * @return Bytes copied, 0 for an empty or invalid slot.
     */
    [[nodiscard]] core::u32 load(core::u32 slot, std::span<core::byte> dst) const noexcept;

    /** @brief Contents of @p slot, std::nullopt if empty or invalid. */
    [[nodiscard]] std::optional<std::span<const core::byte>> read(core::u32 slot) const noexcept;

    [[nodiscard]] bool has(core::u32 slot) const noexcept;

    /** @brief Empties every slot. */
    void clear() noexcept;

    /** @brief Empties the player-owned slots only. */
    void clearPlayerSlots() noexcept;

    /**
     * @brief Fixed little-endian layout used by rollback snapshots.
     *
     * [count:u8] then per slot [present:u8] and, when present,
     * [len:u32][bytes].
     */
    [[nodiscard]] core::Bytes snapshot() const;

    /**
     * @brief Restores a snapshot() image.
     *
     * Truncated input, oversize lengths and trailing bytes are rejected
     * with kCorruptedData; *this is left untouched on error.
     */
    [[nodiscard]] core::Expected<void> restore(std::span<const core::byte> image);

    [[nodiscard]] static bool isValidSlot(core::u32 slot) noexcept { return slot < core::kMaxSaveSlots; }
    [[nodiscard]] static bool isPlayerSlot(core::u32 slot) noexcept { return slot < core::kMaxPlayers; }

    /** @brief Shared slots are writable by anyone; owned ones need their bit in @p localMask. */
    [[nodiscard]] static bool canWrite(core::u32 slot, core::u32 localMask) noexcept;

    bool operator==(const SaveSlots &) const = default;

private:
    std::array<Slot, core::kMaxSaveSlots> _slots;
};

} // namespace cinder::save

#endif // CINDER_SAVE_SAVESLOTS_HPP
