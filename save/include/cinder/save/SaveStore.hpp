/**
 * @file SaveStore.hpp
 * @brief Local profile saves and their mapping onto session slots.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_SAVE_SAVESTORE_HPP
    #define CINDER_SAVE_SAVESTORE_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/core/Expected.hpp>
#include <cinder/save/SaveSlots.hpp>

#include <array>
#include <filesystem>
#include <optional>
#include <string_view>

namespace cinder::save {

/**
 * @brief Rank of @p sessionSlot among the local players of the session.
 *
 * The n-th set bit of @p localMask (ascending, below @p playerCount) is
 * controller n.  Returns std::nullopt for a remote or out-of-range slot.
 */
[[nodiscard]] std::optional<core::u32> mapSessionSlotToControllerSlot(
    core::u32 localMask, core::u32 playerCount, core::u32 sessionSlot) noexcept;

/**
 * @enum SaveMode
 * @brief How the host seeds the player slots before a match.
 */
enum class SaveMode : core::u8
{
    PerPlayer,    ///< Each player keeps their own save.
    Synchronized, ///< Every player slot starts from the host's save.
    NewGame       ///< Player slots start empty.
};

[[nodiscard]] std::string_view toString(SaveMode mode) noexcept;

/** @brief Parses "per-player", "synchronized" or "new-game". */
[[nodiscard]] std::optional<SaveMode> parseSaveMode(std::string_view text) noexcept;

struct SaveConfig
{
    SaveMode                   mode{SaveMode::PerPlayer};
    std::optional<core::Bytes> synchronizedSave;
};

/**
 * @brief Applies @p config to the player slots; shared slots are untouched.
 *
 * A synchronized save longer than kMaxSaveSize is truncated.
 */
void applySaveMode(SaveSlots &slots, const SaveConfig &config);

/**
 * @class SaveStore
 * @brief kPersistentSlots controller saves kept under one directory.
 *
 * Controller n lives in "controller<n>.ncsv", shared slot s in
 * "shared<s>.ncsv", both in SaveFile format.
 */
class SaveStore final
{
public:
    explicit SaveStore(std::filesystem::path directory);

    /**
     * @brief Reads every controller file.
     *
     * Missing or corrupt files leave their controller empty (logged).
     * @return kIoError if a file exists but cannot be read.
     */
    [[nodiscard]] core::Expected<void> load();

    [[nodiscard]] const std::optional<core::Bytes> &controllerSlot(core::u32 controller) const;
    void setControllerSlot(core::u32 controller, std::optional<core::Bytes> data);

    /**
     * @brief Clears the player slots then copies each local controller's
     *        save into its session slot.
     */
    void prefill(SaveSlots &slots, core::u32 localMask, core::u32 playerCount) const;

    /**
     * @brief File a pending write to @p sessionSlot flushes to.
     *
     * std::nullopt for player slots that are not local.
     */
    [[nodiscard]] std::optional<std::filesystem::path> destinationFor(
        core::u32 sessionSlot, core::u32 localMask, core::u32 playerCount) const;

    [[nodiscard]] const std::filesystem::path &directory() const noexcept { return _directory; }

    [[nodiscard]] std::filesystem::path controllerPath(core::u32 controller) const;
    [[nodiscard]] std::filesystem::path sharedPath(core::u32 sessionSlot) const;

private:
    std::filesystem::path                                         _directory;
    std::array<std::optional<core::Bytes>, core::kPersistentSlots> _controllers;
};

} // namespace cinder::save

#endif // CINDER_SAVE_SAVESTORE_HPP
