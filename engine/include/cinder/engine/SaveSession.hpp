/**
 * @file SaveSession.hpp
 * @brief In-match owner of the save slots and their persistence.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_ENGINE_SAVESESSION_HPP
    #define CINDER_ENGINE_SAVESESSION_HPP

#include <cinder/engine/Config.hpp>
#include <cinder/engine/IFrameSource.hpp>
#include <cinder/engine/IRollbackListener.hpp>
#include <cinder/core/Types.hpp>
#include <cinder/core/Expected.hpp>
#include <cinder/core/NonCopyable.hpp>
#include <cinder/persist/PersistencePipeline.hpp>
#include <cinder/save/SaveSlots.hpp>
#include <cinder/save/SaveStore.hpp>

#include <memory>
#include <span>

namespace cinder::engine {

/**
 * @class SaveSession
 * @brief Serves the guest save entry points during a match.
 *
 * Guest writes land in the slot table immediately (it is part of the
 * rolled-back state) and are queued for disk at the current frame.  The
 * rollback engine's confirmations and rollbacks decide which of them reach
 * the disk.
 */
class SaveSession final : public IRollbackListener,
                          public core::NonCopyable<SaveSession>
{
public:
    /**
     * @param config Session configuration (players, save directory, writer poll).
     * @param slots  Slot table produced by SessionBootstrap.
     * @param frames Frame counter of the rollback engine; must outlive *this.
     * @param sink   Commit target of confirmed writes.
     */
    SaveSession(const Config &config, save::SaveSlots slots, const IFrameSource &frames,
                std::unique_ptr<persist::ISaveSink> sink = std::make_unique<persist::FileSaveSink>());

    /** @brief Calls close(). */
    ~SaveSession() override;

    // --------------------------------------------------------------------- //
    //  Guest entry points                                                    //
    // --------------------------------------------------------------------- //

    save::GuestResult save(core::u32 slot, std::span<const core::byte> data);
    [[nodiscard]] core::u32 load(core::u32 slot, std::span<core::byte> dst) const noexcept;
    save::GuestResult erase(core::u32 slot);

    // --------------------------------------------------------------------- //
    //  Rollback engine                                                       //
    // --------------------------------------------------------------------- //

    void onFrameConfirmed(core::Frame frame) override;
    void onRollback(core::Frame target) override;

    /** @brief Slot table image for the per-frame state snapshot. */
    [[nodiscard]] core::Bytes snapshot() const;

    /** @brief Restores a snapshot() image taken at an earlier frame. */
    [[nodiscard]] core::Expected<void> restore(std::span<const core::byte> image);

    /** @brief Flushes every confirmed write and stops the writer. */
    void close();

    [[nodiscard]] const save::SaveSlots            &slots()       const noexcept { return _slots; }
    [[nodiscard]] const persist::PersistencePipeline &persistence() const noexcept { return _pipeline; }

private:
    void queue(core::u32 slot, std::optional<core::Bytes> data);

    core::u32                    _localMask;
    core::u32                    _playerCount;
    save::SaveStore              _store;
    save::SaveSlots              _slots;
    const IFrameSource          &_frames;
    persist::PersistencePipeline _pipeline;
    bool                         _closed{false};
};

} // namespace cinder::engine

#endif // CINDER_ENGINE_SAVESESSION_HPP
