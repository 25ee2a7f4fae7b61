/**
 * @file PersistencePipeline.cpp
 * @brief PersistencePipeline implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/persist/PersistencePipeline.hpp>
#include <cinder/core/Log.hpp>

#include <format>
#include <vector>

namespace cinder::persist {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

PersistencePipeline::PersistencePipeline(std::chrono::milliseconds pollInterval,
                                         std::unique_ptr<ISaveSink> sink)
    : _pollInterval{pollInterval}
    , _sink{std::move(sink)}
{
}

PersistencePipeline::~PersistencePipeline()
{
    stop();
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void PersistencePipeline::start()
{
    if (_writer.joinable())
    {
        return;
    }
    _stopping.store(false, std::memory_order_release);
    _writer = std::thread{&PersistencePipeline::writerLoop, this};
}

void PersistencePipeline::stop()
{
    if (_writer.joinable())
    {
        {
            std::lock_guard<std::mutex> lock{_mutex};
            _stopping.store(true, std::memory_order_release);
        }
        _cv.notify_all();
        _writer.join();
    }
    (void) drain();
}

// -------------------------------------------------------------------------- //
//  Frame loop                                                                //
// -------------------------------------------------------------------------- //

void PersistencePipeline::queueWrite(core::u32 slot, std::optional<core::Bytes> data, core::Frame frame,
                                     std::filesystem::path destination)
{
    std::lock_guard<std::mutex> lock{_mutex};
    _table.queue(PendingWrite{frame, slot, std::move(data), std::move(destination)});
}

void PersistencePipeline::onFrameConfirmed(core::Frame frame)
{
    core::usize promoted = 0;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        promoted = _table.confirm(frame);
        _wake = _wake || promoted > 0;
    }
    if (promoted > 0)
    {
        _cv.notify_one();
    }
}

void PersistencePipeline::onRollback(core::Frame target)
{
    core::usize dropped = 0;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        dropped = _table.discardAfter(target);
    }
    if (dropped > 0)
    {
        core::Log::debug("Persist", std::format("rollback to frame {} dropped {} pending write(s)", target, dropped));
    }
}

// -------------------------------------------------------------------------- //
//  Flushing                                                                  //
// -------------------------------------------------------------------------- //

core::usize PersistencePipeline::flushNow()
{
    return drain();
}

bool PersistencePipeline::waitUntilIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock{_mutex};
    return _idleCv.wait_for(lock, timeout, [this] {
        return _inFlight == 0 && _table.eligibleCount() == 0;
    });
}

std::optional<core::Frame> PersistencePipeline::unconfirmedFrame(core::u32 slot) const
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (const auto *record = _table.unconfirmed(slot))
    {
        return record->frame;
    }
    return std::nullopt;
}

std::optional<core::Frame> PersistencePipeline::eligibleFrame(core::u32 slot) const
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (const auto *record = _table.eligible(slot))
    {
        return record->frame;
    }
    return std::nullopt;
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void PersistencePipeline::writerLoop()
{
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock{_mutex};
            _cv.wait_for(lock, _pollInterval, [this] {
                return _stopping.load(std::memory_order_relaxed) || _wake;
            });
            _wake = false;
        }

        if (_stopping.load(std::memory_order_acquire))
        {
            return;
        }
        (void) drain();
    }
}

core::usize PersistencePipeline::drain()
{
    std::lock_guard<std::mutex> commit{_commitMutex};

    std::vector<PendingWrite> batch;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        batch = _table.takeEligible();
        _inFlight += batch.size();
    }

    core::usize written = 0;
    for (auto &record : batch)
    {
        auto result = _sink->commit(record);
        if (result)
        {
            ++written;
            _flushed.fetch_add(1, std::memory_order_relaxed);
            core::Log::debug("Persist", std::format("slot {} frame {} -> {}", record.slot, record.frame,
                                                    record.destination.string()));
            continue;
        }

        _failed.fetch_add(1, std::memory_order_relaxed);
        core::Log::warn("Persist", std::format("slot {} frame {} not persisted, retrying: {}",
                                               record.slot, record.frame, result.error().message()));

        std::lock_guard<std::mutex> lock{_mutex};
        if (!_table.requeue(std::move(record)))
        {
            core::Log::debug("Persist", "failed write superseded by a newer confirmed one");
        }
    }

    {
        std::lock_guard<std::mutex> lock{_mutex};
        _inFlight -= batch.size();
    }
    _idleCv.notify_all();
    return written;
}

} // namespace cinder::persist
