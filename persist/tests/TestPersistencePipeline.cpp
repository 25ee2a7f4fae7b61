/**
 * @file TestPersistencePipeline.cpp
 * @brief Unit tests for the deferred save writer.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/persist/PersistencePipeline.hpp>
#include <cinder/save/SaveFile.hpp>

#include "TempDir.hpp"

#include <mutex>
#include <vector>

namespace cinder::persist {

using namespace std::chrono_literals;
using tests::TempDir;

namespace {

/// Records commits; the first @c failures of them are rejected.
class RecordingSink final : public ISaveSink
{
public:
    explicit RecordingSink(int failures = 0) : _failures{failures} {}

    core::Expected<void> commit(const PendingWrite &record) override
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_failures > 0)
        {
            --_failures;
            return core::makeError(core::ErrorCode::kIoError, "disk unplugged");
        }
        _commits.push_back(record);
        return {};
    }

    std::vector<PendingWrite> commits() const
    {
        std::lock_guard<std::mutex> lock{_mutex};
        return _commits;
    }

private:
    mutable std::mutex        _mutex;
    int                       _failures;
    std::vector<PendingWrite> _commits;
};

core::Bytes tagged(core::u8 tag)
{
    return core::Bytes(16, static_cast<core::byte>(tag));
}

} // namespace

TEST_CASE("Nothing is written before its frame is confirmed", "[persist][pipeline]")
{
    auto sink  = std::make_unique<RecordingSink>();
    auto &seen = *sink;
    PersistencePipeline pipeline{1h, std::move(sink)};

    pipeline.queueWrite(0, tagged(1), 100, "controller0.ncsv");
    REQUIRE(pipeline.unconfirmedFrame(0) == 100u);
    REQUIRE(pipeline.flushNow() == 0);
    REQUIRE(seen.commits().empty());

    pipeline.onFrameConfirmed(99);
    REQUIRE(pipeline.flushNow() == 0);

    pipeline.onFrameConfirmed(100);
    REQUIRE(pipeline.eligibleFrame(0) == 100u);
    REQUIRE(pipeline.flushNow() == 1);
    REQUIRE(seen.commits().size() == 1);
    REQUIRE(pipeline.flushedCount() == 1);
}

TEST_CASE("Rolled back writes never reach the sink", "[persist][pipeline]")
{
    auto sink  = std::make_unique<RecordingSink>();
    auto &seen = *sink;
    PersistencePipeline pipeline{1h, std::move(sink)};

    pipeline.queueWrite(0, tagged(1), 100, "controller0.ncsv");
    pipeline.onRollback(98);
    pipeline.onFrameConfirmed(200);

    REQUIRE(pipeline.flushNow() == 0);
    REQUIRE(seen.commits().empty());
}

TEST_CASE("An older write survives the rollback of a newer one", "[persist][pipeline]")
{
    auto sink  = std::make_unique<RecordingSink>();
    auto &seen = *sink;
    PersistencePipeline pipeline{1h, std::move(sink)};

    pipeline.queueWrite(0, tagged(0xAA), 98, "controller0.ncsv");
    pipeline.queueWrite(0, tagged(0xBB), 100, "controller0.ncsv");
    pipeline.onRollback(99);
    REQUIRE(pipeline.unconfirmedFrame(0) == 98u);

    pipeline.onFrameConfirmed(120);
    REQUIRE(pipeline.flushNow() == 1);
    const auto commits = seen.commits();
    REQUIRE(commits.size() == 1);
    REQUIRE(commits.front().frame == 98);
    REQUIRE(commits.front().data == tagged(0xAA));
}

TEST_CASE("A write redone after rollback persists the new data", "[persist][pipeline]")
{
    TempDir dir{"cinder-persist"};
    const auto path = dir.path() / "controller0.ncsv";
    PersistencePipeline pipeline{1h};

    pipeline.queueWrite(0, tagged(0xAA), 100, path);
    pipeline.onRollback(99);
    pipeline.queueWrite(0, tagged(0xBB), 100, path);
    pipeline.onFrameConfirmed(100);

    REQUIRE(pipeline.flushNow() == 1);
    const auto stored = save::SaveFile::read(path);
    REQUIRE(stored.has_value());
    REQUIRE(*stored == tagged(0xBB));
}

TEST_CASE("A confirmed delete removes the file", "[persist][pipeline]")
{
    TempDir dir{"cinder-persist"};
    const auto path = dir.path() / "shared5.ncsv";
    REQUIRE(save::SaveFile::write(path, tagged(5)).has_value());

    PersistencePipeline pipeline{1h};
    pipeline.queueWrite(5, std::nullopt, 3, path);
    pipeline.onFrameConfirmed(3);

    REQUIRE(pipeline.flushNow() == 1);
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("Failed commits are retried", "[persist][pipeline]")
{
    auto sink  = std::make_unique<RecordingSink>(1);
    auto &seen = *sink;
    PersistencePipeline pipeline{1h, std::move(sink)};

    pipeline.queueWrite(1, tagged(1), 10, "controller1.ncsv");
    pipeline.onFrameConfirmed(10);

    REQUIRE(pipeline.flushNow() == 0);
    REQUIRE(pipeline.failedCount() == 1);
    REQUIRE(pipeline.eligibleFrame(1) == 10u);

    REQUIRE(pipeline.flushNow() == 1);
    REQUIRE(seen.commits().size() == 1);
    REQUIRE(seen.commits().front().frame == 10);
}

TEST_CASE("A failed commit yields to a newer confirmed write", "[persist][pipeline]")
{
    auto sink  = std::make_unique<RecordingSink>(1);
    auto &seen = *sink;
    PersistencePipeline pipeline{1h, std::move(sink)};

    pipeline.queueWrite(1, tagged(1), 10, "controller1.ncsv");
    pipeline.onFrameConfirmed(10);
    REQUIRE(pipeline.flushNow() == 0);

    // The failed frame-10 record sits in the eligible stage; the newer write
    // replaces it on confirmation.
    pipeline.queueWrite(1, tagged(2), 12, "controller1.ncsv");
    pipeline.onFrameConfirmed(12);

    REQUIRE(pipeline.flushNow() == 1);
    const auto commits = seen.commits();
    REQUIRE(commits.size() == 1);
    REQUIRE(commits.front().frame == 12);
}

TEST_CASE("The writer thread flushes confirmed writes", "[persist][pipeline][thread]")
{
    auto sink  = std::make_unique<RecordingSink>();
    auto &seen = *sink;
    PersistencePipeline pipeline{5ms, std::move(sink)};
    pipeline.start();
    REQUIRE(pipeline.running());

    for (core::u32 slot = 0; slot < 4; ++slot)
        pipeline.queueWrite(slot, tagged(static_cast<core::u8>(slot)), 50 + slot, "slot.ncsv");
    pipeline.onFrameConfirmed(60);

    REQUIRE(pipeline.waitUntilIdle(5s));
    REQUIRE(seen.commits().size() == 4);

    pipeline.stop();
    REQUIRE_FALSE(pipeline.running());
}

TEST_CASE("stop drains what is still eligible", "[persist][pipeline][thread]")
{
    auto sink  = std::make_unique<RecordingSink>();
    auto &seen = *sink;
    {
        PersistencePipeline pipeline{1h, std::move(sink)};
        pipeline.start();
        pipeline.queueWrite(6, tagged(6), 1, "shared6.ncsv");
        pipeline.stop();
        REQUIRE(seen.commits().empty());

        pipeline.onFrameConfirmed(1);
        pipeline.stop();
        REQUIRE(seen.commits().size() == 1);
    }
}

} // namespace cinder::persist
