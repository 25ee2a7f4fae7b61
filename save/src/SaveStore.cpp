/**
 * @file SaveStore.cpp
 * @brief SaveStore implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/save/SaveStore.hpp>
#include <cinder/save/SaveFile.hpp>
#include <cinder/core/Assert.hpp>
#include <cinder/core/Log.hpp>

#include <algorithm>
#include <format>

namespace cinder::save {

std::optional<core::u32> mapSessionSlotToControllerSlot(
    core::u32 localMask, core::u32 playerCount, core::u32 sessionSlot) noexcept
{
    playerCount = std::min(playerCount, core::kMaxPlayers);
    if (sessionSlot >= playerCount || (localMask & (1u << sessionSlot)) == 0)
    {
        return std::nullopt;
    }

    core::u32 controller = 0;
    for (core::u32 slot = 0; slot < sessionSlot; ++slot)
    {
        if (localMask & (1u << slot))
        {
            ++controller;
        }
    }
    return controller;
}

std::string_view toString(SaveMode mode) noexcept
{
    switch (mode)
    {
    case SaveMode::PerPlayer:    return "per-player";
    case SaveMode::Synchronized: return "synchronized";
    case SaveMode::NewGame:      return "new-game";
    }
    return "unknown";
}

std::optional<SaveMode> parseSaveMode(std::string_view text) noexcept
{
    for (const auto mode : {SaveMode::PerPlayer, SaveMode::Synchronized, SaveMode::NewGame})
    {
        if (text == toString(mode))
        {
            return mode;
        }
    }
    return std::nullopt;
}

void applySaveMode(SaveSlots &slots, const SaveConfig &config)
{
    switch (config.mode)
    {
    case SaveMode::PerPlayer:
        break;
    case SaveMode::Synchronized:
        if (config.synchronizedSave)
        {
            const auto &source = *config.synchronizedSave;
            const auto  length = std::min(source.size(), core::kMaxSaveSize);
            for (core::u32 slot = 0; slot < core::kMaxPlayers; ++slot)
            {
                // Length is clamped above, assign cannot fail.
                (void) slots.assign(slot, core::Bytes(source.begin(), source.begin() + static_cast<std::ptrdiff_t>(length)));
            }
        }
        break;
    case SaveMode::NewGame:
        slots.clearPlayerSlots();
        break;
    }
}

SaveStore::SaveStore(std::filesystem::path directory)
    : _directory{std::move(directory)}
{
}

core::Expected<void> SaveStore::load()
{
    for (core::u32 controller = 0; controller < core::kPersistentSlots; ++controller)
    {
        const auto path = controllerPath(controller);
        auto data = SaveFile::read(path);
        if (data)
        {
            core::Log::debug("SaveStore", std::format("controller {}: {} bytes", controller, data->size()));
            _controllers[controller] = std::move(*data);
            continue;
        }

        _controllers[controller].reset();
        switch (data.error().code())
        {
        case core::ErrorCode::kNotFound:
            break;
        case core::ErrorCode::kIoError:
            return std::unexpected(std::move(data.error()));
        default:
            core::Log::warn("SaveStore", std::format("ignoring controller {} save: {}",
                                                     controller, data.error().message()));
            break;
        }
    }
    return {};
}

const std::optional<core::Bytes> &SaveStore::controllerSlot(core::u32 controller) const
{
    CINDER_VERIFY(controller < core::kPersistentSlots);
    return _controllers[controller];
}

void SaveStore::setControllerSlot(core::u32 controller, std::optional<core::Bytes> data)
{
    CINDER_VERIFY(controller < core::kPersistentSlots);
    _controllers[controller] = std::move(data);
}

void SaveStore::prefill(SaveSlots &slots, core::u32 localMask, core::u32 playerCount) const
{
    slots.clearPlayerSlots();

    playerCount = std::min(playerCount, core::kMaxPlayers);
    for (core::u32 sessionSlot = 0; sessionSlot < playerCount; ++sessionSlot)
    {
        const auto controller = mapSessionSlotToControllerSlot(localMask, playerCount, sessionSlot);
        if (!controller || *controller >= core::kPersistentSlots || !_controllers[*controller])
        {
            continue;
        }
        if (auto result = slots.assign(sessionSlot, _controllers[*controller]); !result)
        {
            core::Log::warn("SaveStore", result.error().message());
        }
    }
}

std::optional<std::filesystem::path> SaveStore::destinationFor(
    core::u32 sessionSlot, core::u32 localMask, core::u32 playerCount) const
{
    if (!SaveSlots::isValidSlot(sessionSlot))
    {
        return std::nullopt;
    }
    if (!SaveSlots::isPlayerSlot(sessionSlot))
    {
        return sharedPath(sessionSlot);
    }
    const auto controller = mapSessionSlotToControllerSlot(localMask, playerCount, sessionSlot);
    if (!controller || *controller >= core::kPersistentSlots)
    {
        return std::nullopt;
    }
    return controllerPath(*controller);
}

std::filesystem::path SaveStore::controllerPath(core::u32 controller) const
{
    return _directory / std::format("controller{}.ncsv", controller);
}

std::filesystem::path SaveStore::sharedPath(core::u32 sessionSlot) const
{
    return _directory / std::format("shared{}.ncsv", sessionSlot);
}

} // namespace cinder::save
