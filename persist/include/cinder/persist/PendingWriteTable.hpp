/**
 * @file PendingWriteTable.hpp
 * @brief Per-slot arena of unconfirmed and flush-eligible writes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_PERSIST_PENDINGWRITETABLE_HPP
    #define CINDER_PERSIST_PENDINGWRITETABLE_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/persist/PendingWrite.hpp>

#include <array>
#include <optional>
#include <vector>

namespace cinder::persist {

/**
 * @class PendingWriteTable
 * @brief Holds, per slot, the unconfirmed writes in frame order and at
 *        most one confirmed write waiting for the disk.
 *
 * Unconfirmed writes of a slot are kept until a confirmation or a rollback
 * settles them, so rolling back a newer write exposes the older one again.
 * Confirmation promotes the newest write at or below the confirmed frame,
 * replacing any older confirmed write of the slot.  Only confirmed writes
 * are handed to the writer.
 *
 * Not synchronized; PersistencePipeline guards it with its mutex.
 */
class PendingWriteTable final
{
public:
    /**
     * @brief Appends an unconfirmed write to @p record.slot, dropping the
     *        ones at the same or a later frame.
     */
    void queue(PendingWrite record);

    /**
     * @brief Promotes, per slot, the newest unconfirmed write with
     *        frame <= @p confirmed and drops the older ones.
     * @return Number of slots that received a promoted write.
     */
    core::usize confirm(core::Frame confirmed);

    /**
     * @brief Drops every write with frame > @p target.
     * @return Number of writes dropped.
     */
    core::usize discardAfter(core::Frame target);

    /** @brief Moves every confirmed write out, ordered by slot. */
    [[nodiscard]] std::vector<PendingWrite> takeEligible();

    /**
     * @brief Puts back a write whose flush failed.
     * @return @c false if a newer confirmed write for the slot exists, in
     *         which case @p record is dropped.
     */
    bool requeue(PendingWrite record);

    /** @brief Newest unconfirmed write of @p slot, or nullptr. */
    [[nodiscard]] const PendingWrite *unconfirmed(core::u32 slot) const noexcept;
    [[nodiscard]] const PendingWrite *eligible(core::u32 slot) const noexcept;

    [[nodiscard]] core::usize eligibleCount() const noexcept;
    [[nodiscard]] bool        empty() const noexcept;

private:
    std::array<std::vector<PendingWrite>, core::kMaxSaveSlots>   _unconfirmed;
    std::array<std::optional<PendingWrite>, core::kMaxSaveSlots> _eligible;
};

} // namespace cinder::persist

#endif // CINDER_PERSIST_PENDINGWRITETABLE_HPP
