/**
 * @file SaveSession.cpp
 * @brief SaveSession implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/engine/SaveSession.hpp>
#include <cinder/core/Log.hpp>

#include <format>

namespace cinder::engine {

SaveSession::SaveSession(const Config &config, save::SaveSlots slots, const IFrameSource &frames,
                         std::unique_ptr<persist::ISaveSink> sink)
    : _localMask{config.localPlayerMask()}
    , _playerCount{config.playerCount()}
    , _store{config.saveDirectory()}
    , _slots{std::move(slots)}
    , _frames{frames}
    , _pipeline{config.writerPollInterval(), std::move(sink)}
{
    _pipeline.start();
}

SaveSession::~SaveSession()
{
    close();
}

save::GuestResult SaveSession::save(core::u32 slot, std::span<const core::byte> data)
{
    const auto result = _slots.write(slot, data, _localMask);
    if (!result)
    {
        core::Log::debug("SaveSession", std::format("save to slot {} rejected: {}", slot, result.error().message()));
        return save::toGuestResult(result);
    }
    queue(slot, core::Bytes(data.begin(), data.end()));
    return save::GuestResult::Ok;
}

core::u32 SaveSession::load(core::u32 slot, std::span<core::byte> dst) const noexcept
{
    return _slots.load(slot, dst);
}

save::GuestResult SaveSession::erase(core::u32 slot)
{
    const auto result = _slots.erase(slot, _localMask);
    if (!result)
    {
        core::Log::debug("SaveSession", std::format("delete of slot {} rejected: {}", slot, result.error().message()));
        return save::toGuestResult(result);
    }
    queue(slot, std::nullopt);
    return save::GuestResult::Ok;
}

void SaveSession::onFrameConfirmed(core::Frame frame)
{
    _pipeline.onFrameConfirmed(frame);
}

void SaveSession::onRollback(core::Frame target)
{
    _pipeline.onRollback(target);
}

core::Bytes SaveSession::snapshot() const
{
    return _slots.snapshot();
}

core::Expected<void> SaveSession::restore(std::span<const core::byte> image)
{
    return _slots.restore(image);
}

void SaveSession::close()
{
    if (_closed)
    {
        return;
    }
    _closed = true;
    _pipeline.stop();
    core::Log::info("SaveSession", std::format("closed, {} write(s) persisted, {} failed attempt(s)",
                                               _pipeline.flushedCount(), _pipeline.failedCount()));
}

void SaveSession::queue(core::u32 slot, std::optional<core::Bytes> data)
{
    // Remote players persist their own slots on their own machines.
    const auto destination = _store.destinationFor(slot, _localMask, _playerCount);
    if (!destination)
    {
        return;
    }
    _pipeline.queueWrite(slot, std::move(data), _frames.currentFrame(), *destination);
}

} // namespace cinder::engine
