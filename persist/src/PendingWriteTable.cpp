/**
 * @file PendingWriteTable.cpp
 * @brief PendingWriteTable implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/persist/PendingWriteTable.hpp>
#include <cinder/core/Assert.hpp>

#include <algorithm>
#include <iterator>

namespace cinder::persist {

void PendingWriteTable::queue(PendingWrite record)
{
    CINDER_VERIFY(record.slot < core::kMaxSaveSlots);
    auto &pending = _unconfirmed[record.slot];
    std::erase_if(pending, [&record](const PendingWrite &older) { return older.frame >= record.frame; });
    pending.push_back(std::move(record));
}

core::usize PendingWriteTable::confirm(core::Frame confirmed)
{
    core::usize promoted = 0;
    for (core::u32 slot = 0; slot < core::kMaxSaveSlots; ++slot)
    {
        auto &pending = _unconfirmed[slot];
        const auto settled = std::ranges::find_if(pending, [confirmed](const PendingWrite &record) {
            return record.frame > confirmed;
        });
        if (settled == pending.begin())
        {
            continue;
        }
        _eligible[slot] = std::move(*std::prev(settled));
        pending.erase(pending.begin(), settled);
        ++promoted;
    }
    return promoted;
}

core::usize PendingWriteTable::discardAfter(core::Frame target)
{
    core::usize dropped = 0;
    for (auto &pending : _unconfirmed)
    {
        dropped += std::erase_if(pending, [target](const PendingWrite &record) { return record.frame > target; });
    }
    for (auto &record : _eligible)
    {
        if (record && record->frame > target)
        {
            record.reset();
            ++dropped;
        }
    }
    return dropped;
}

std::vector<PendingWrite> PendingWriteTable::takeEligible()
{
    std::vector<PendingWrite> out;
    for (auto &record : _eligible)
    {
        if (record)
        {
            out.push_back(std::move(*record));
            record.reset();
        }
    }
    return out;
}

bool PendingWriteTable::requeue(PendingWrite record)
{
    CINDER_VERIFY(record.slot < core::kMaxSaveSlots);
    auto &current = _eligible[record.slot];
    if (current)
    {
        return false;
    }
    current = std::move(record);
    return true;
}

const PendingWrite *PendingWriteTable::unconfirmed(core::u32 slot) const noexcept
{
    return slot < core::kMaxSaveSlots && !_unconfirmed[slot].empty() ? &_unconfirmed[slot].back() : nullptr;
}

const PendingWrite *PendingWriteTable::eligible(core::u32 slot) const noexcept
{
    return slot < core::kMaxSaveSlots && _eligible[slot] ? &*_eligible[slot] : nullptr;
}

core::usize PendingWriteTable::eligibleCount() const noexcept
{
    return static_cast<core::usize>(std::ranges::count_if(_eligible, [](const auto &r) { return r.has_value(); }));
}

bool PendingWriteTable::empty() const noexcept
{
    return std::ranges::all_of(_unconfirmed, [](const auto &pending) { return pending.empty(); })
        && eligibleCount() == 0;
}

} // namespace cinder::persist
