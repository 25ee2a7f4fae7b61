/**
 * @file PersistencePipeline.hpp
 * @brief Rollback-safe background save writer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_PERSIST_PERSISTENCEPIPELINE_HPP
    #define CINDER_PERSIST_PERSISTENCEPIPELINE_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/NonCopyable.hpp>
#include <cinder/persist/ISaveSink.hpp>
#include <cinder/persist/PendingWriteTable.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace cinder::persist {

/**
 * @class PersistencePipeline
 * @brief Defers save writes until their frame can no longer be rolled back.
 *
 * The frame loop calls queueWrite(), onFrameConfirmed() and onRollback();
 * none of them touch the disk.  A single writer thread wakes every poll
 * interval (or when a confirmation arrives), takes the confirmed records
 * under the lock and commits them outside it.  Failed commits are logged
 * and retried on the next poll.
 */
class PersistencePipeline final : public core::NonCopyable<PersistencePipeline>
{
public:
    explicit PersistencePipeline(std::chrono::milliseconds pollInterval,
                                 std::unique_ptr<ISaveSink> sink = std::make_unique<FileSaveSink>());

    /** @brief Stops the writer after a final drain. */
    ~PersistencePipeline();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /** @brief Spawns the writer thread (no-op if running). */
    void start();

    /** @brief Joins the writer thread, then drains what is still eligible. */
    void stop();

    [[nodiscard]] bool running() const noexcept { return _writer.joinable(); }

    // --------------------------------------------------------------------- //
    //  Frame loop                                                            //
    // --------------------------------------------------------------------- //

    /** @brief Records a write (or delete, @p data empty) made at @p frame. */
    void queueWrite(core::u32 slot, std::optional<core::Bytes> data, core::Frame frame,
                    std::filesystem::path destination);

    /** @brief Makes writes up to @p frame eligible and wakes the writer. */
    void onFrameConfirmed(core::Frame frame);

    /** @brief Forgets writes made after @p target. */
    void onRollback(core::Frame target);

    // --------------------------------------------------------------------- //
    //  Flushing                                                              //
    // --------------------------------------------------------------------- //

    /**
     * @brief Commits every eligible write on the calling thread.
     * @return Number of writes committed successfully.
     */
    core::usize flushNow();

    /**
     * @brief Blocks until nothing eligible is left or being written.
     * @return @c false on timeout.
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] core::u64 flushedCount() const noexcept { return _flushed.load(std::memory_order_relaxed); }
    [[nodiscard]] core::u64 failedCount()  const noexcept { return _failed.load(std::memory_order_relaxed); }

    /** @brief Frame of the unconfirmed write of @p slot, if any. */
    [[nodiscard]] std::optional<core::Frame> unconfirmedFrame(core::u32 slot) const;

    /** @brief Frame of the confirmed, not yet flushed write of @p slot. */
    [[nodiscard]] std::optional<core::Frame> eligibleFrame(core::u32 slot) const;

private:
    void        writerLoop();
    core::usize drain();

    std::chrono::milliseconds  _pollInterval;
    std::unique_ptr<ISaveSink> _sink;

    mutable std::mutex      _mutex;
    std::condition_variable _cv;
    std::condition_variable _idleCv;
    PendingWriteTable       _table;
    bool                    _wake{false};
    core::usize             _inFlight{0};

    // Serializes commits so an older record never lands after a newer one.
    std::mutex _commitMutex;

    std::thread            _writer;
    std::atomic<bool>      _stopping{false};
    std::atomic<core::u64> _flushed{0};
    std::atomic<core::u64> _failed{0};
};

} // namespace cinder::persist

#endif // CINDER_PERSIST_PERSISTENCEPIPELINE_HPP
