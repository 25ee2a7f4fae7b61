/**
 * @file SaveSlots.cpp
 * @brief SaveSlots implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/save/SaveSlots.hpp>
#include <cinder/net/protocol/ByteStream.hpp>

#include <algorithm>
#include <format>

namespace cinder::save {

GuestResult toGuestResult(const core::Expected<void> &result) noexcept
{
    if (result)
    {
        return GuestResult::Ok;
    }
    switch (result.error().code())
    {
    case core::ErrorCode::kSaveTooLarge: return GuestResult::TooLarge;
    case core::ErrorCode::kSaveNotOwner: return GuestResult::NotOwner;
    default:                             return GuestResult::InvalidSlot;
    }
}

bool SaveSlots::canWrite(core::u32 slot, core::u32 localMask) noexcept
{
    return !isPlayerSlot(slot) || (localMask & (1u << slot)) != 0;
}

core::Expected<void> SaveSlots::write(core::u32 slot, std::span<const core::byte> data, core::u32 localMask)
{
    if (!isValidSlot(slot))
    {
        return core::makeError(core::ErrorCode::kSaveInvalidSlot, std::format("slot {} does not exist", slot));
    }
    if (data.size() > core::kMaxSaveSize)
    {
        return core::makeError(core::ErrorCode::kSaveTooLarge,
                               std::format("{} bytes exceed the {}-byte slot limit", data.size(), core::kMaxSaveSize));
    }
    if (!canWrite(slot, localMask))
    {
        return core::makeError(core::ErrorCode::kSaveNotOwner,
                               std::format("slot {} belongs to a remote player", slot));
    }
    _slots[slot].emplace(data.begin(), data.end());
    return {};
}

core::Expected<void> SaveSlots::erase(core::u32 slot, core::u32 localMask)
{
    if (!isValidSlot(slot))
    {
        return core::makeError(core::ErrorCode::kSaveInvalidSlot, std::format("slot {} does not exist", slot));
    }
    if (!canWrite(slot, localMask))
    {
        return core::makeError(core::ErrorCode::kSaveNotOwner,
                               std::format("slot {} belongs to a remote player", slot));
    }
    _slots[slot].reset();
    return {};
}

core::Expected<void> SaveSlots::assign(core::u32 slot, Slot data)
{
    if (!isValidSlot(slot))
    {
        return core::makeError(core::ErrorCode::kSaveInvalidSlot, std::format("slot {} does not exist", slot));
    }
    if (data && data->size() > core::kMaxSaveSize)
    {
        return core::makeError(core::ErrorCode::kSaveTooLarge,
                               std::format("{} bytes exceed the {}-byte slot limit", data->size(), core::kMaxSaveSize));
    }
    _slots[slot] = std::move(data);
    return {};
}

core::u32 SaveSlots::load(core::u32 slot, std::span<core::byte> dst) const noexcept
{
    if (!isValidSlot(slot) || !_slots[slot])
    {
        return 0;
    }
    const auto &data  = *_slots[slot];
    const auto  count = std::min(data.size(), dst.size());
    std::copy_n(data.begin(), count, dst.begin());
    return static_cast<core::u32>(count);
}

std::optional<std::span<const core::byte>> SaveSlots::read(core::u32 slot) const noexcept
{
    if (!isValidSlot(slot) || !_slots[slot])
    {
        return std::nullopt;
    }
    return std::span<const core::byte>{*_slots[slot]};
}

bool SaveSlots::has(core::u32 slot) const noexcept
{
    return isValidSlot(slot) && _slots[slot].has_value();
}

void SaveSlots::clear() noexcept
{
    for (auto &slot : _slots)
    {
        slot.reset();
    }
}

void SaveSlots::clearPlayerSlots() noexcept
{
    for (core::u32 i = 0; i < core::kMaxPlayers; ++i)
    {
        _slots[i].reset();
    }
}

// ========================================================================== //
//  Snapshot                                                                  //
// ========================================================================== //

core::Bytes SaveSlots::snapshot() const
{
    core::usize size = 1;
    for (const auto &slot : _slots)
    {
        size += 1 + (slot ? 4 + slot->size() : 0);
    }

    net::protocol::ByteStream out{size};
    out.writeU8(static_cast<core::u8>(_slots.size()));
    for (const auto &slot : _slots)
    {
        out.writeU8(slot ? 1 : 0);
        if (slot)
        {
            out.writeU32(static_cast<core::u32>(slot->size()));
            out.writeBytes(*slot);
        }
    }
    return out.release();
}

core::Expected<void> SaveSlots::restore(std::span<const core::byte> image)
{
    const auto corrupted = [](std::string why) {
        return core::makeError(core::ErrorCode::kCorruptedData, "slot snapshot: " + std::move(why));
    };

    net::protocol::ByteStream in{image};
    const auto count = in.readU8();
    if (!count)
    {
        return corrupted("empty image");
    }
    if (*count != core::kMaxSaveSlots)
    {
        return corrupted(std::format("{} slots, expected {}", *count, core::kMaxSaveSlots));
    }

    std::array<Slot, core::kMaxSaveSlots> decoded;
    for (core::u32 i = 0; i < core::kMaxSaveSlots; ++i)
    {
        const auto present = in.readU8();
        if (!present || *present > 1)
        {
            return corrupted(std::format("bad presence flag for slot {}", i));
        }
        if (*present == 0)
        {
            continue;
        }
        const auto length = in.readU32();
        if (!length || *length > core::kMaxSaveSize)
        {
            return corrupted(std::format("bad length for slot {}", i));
        }
        const auto bytes = in.readSpan(*length);
        if (!bytes)
        {
            return corrupted(std::format("slot {} truncated", i));
        }
        decoded[i].emplace(bytes->begin(), bytes->end());
    }

    if (in.remaining() != 0)
    {
        return corrupted(std::format("{} trailing bytes", in.remaining()));
    }

    _slots = std::move(decoded);
    return {};
}

} // namespace cinder::save
