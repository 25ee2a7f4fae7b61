/**
 * @file TestSaveSession.cpp
 * @brief Guest save entry points and their deferred persistence.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/engine/SaveSession.hpp>
#include <cinder/save/SaveFile.hpp>

#include "TempDir.hpp"

#include <array>

namespace cinder::engine {

using namespace std::chrono_literals;
using save::GuestResult;
using tests::TempDir;

namespace {

struct ManualFrames final : IFrameSource
{
    core::Frame frame{0};
    core::Frame currentFrame() const override { return frame; }
};

core::Bytes tagged(core::u8 tag, core::usize size = 8)
{
    return core::Bytes(size, static_cast<core::byte>(tag));
}

/// Player 1 of 2 is local, so session slot 1 persists as controller 0.
Config localSecondPlayer(const std::filesystem::path &dir)
{
    return Config::Builder{}.playerCount(2).localPlayer(1).writerPollInterval(5ms).saveDirectory(dir).build();
}

} // namespace

TEST_CASE("Guest writes follow slot ownership", "[session]")
{
    TempDir dir{"cinder-session"};
    ManualFrames frames;
    SaveSession session{localSecondPlayer(dir.path()), save::SaveSlots{}, frames};

    REQUIRE(session.save(1, tagged(1)) == GuestResult::Ok);
    REQUIRE(session.save(0, tagged(2)) == GuestResult::NotOwner);
    REQUIRE(session.save(core::kMaxSaveSlots, tagged(3)) == GuestResult::InvalidSlot);
    REQUIRE(session.save(4, tagged(4, core::kMaxSaveSize + 1)) == GuestResult::TooLarge);
    REQUIRE(session.save(4, tagged(4)) == GuestResult::Ok);
    REQUIRE(session.erase(0) == GuestResult::NotOwner);

    std::array<core::byte, 4> buffer{};
    REQUIRE(session.load(1, buffer) == 4);
    REQUIRE(buffer[0] == core::byte{1});
    REQUIRE(session.load(0, buffer) == 0);
}

TEST_CASE("A confirmed write reaches the controller file", "[session][persist]")
{
    TempDir dir{"cinder-session"};
    ManualFrames frames;
    save::SaveStore store{dir.path()};
    {
        SaveSession session{localSecondPlayer(dir.path()), save::SaveSlots{}, frames};

        frames.frame = 100;
        REQUIRE(session.save(1, tagged(0x11)) == GuestResult::Ok);
        REQUIRE(session.persistence().unconfirmedFrame(1) == 100u);
        REQUIRE_FALSE(std::filesystem::exists(store.controllerPath(0)));

        session.onFrameConfirmed(100);
        session.close();
    }

    const auto stored = save::SaveFile::read(store.controllerPath(0));
    REQUIRE(stored.has_value());
    REQUIRE(*stored == tagged(0x11));
}

TEST_CASE("Rollback discards writes and restores the slot table", "[session][rollback]")
{
    TempDir dir{"cinder-session"};
    ManualFrames frames;
    save::SaveStore store{dir.path()};

    save::SaveSlots initial;
    REQUIRE(initial.assign(4, tagged(0x40)).has_value());
    SaveSession session{localSecondPlayer(dir.path()), initial, frames};

    frames.frame = 99;
    const auto image = session.snapshot();

    frames.frame = 100;
    REQUIRE(session.save(4, tagged(0x41)) == GuestResult::Ok);

    // Rollback to 99, then resimulate frame 100 writing something else.
    session.onRollback(99);
    REQUIRE(session.restore(image).has_value());
    REQUIRE(session.slots() == initial);

    REQUIRE(session.save(4, tagged(0x42)) == GuestResult::Ok);
    session.onFrameConfirmed(100);
    session.close();

    const auto stored = save::SaveFile::read(store.sharedPath(4));
    REQUIRE(stored.has_value());
    REQUIRE(*stored == tagged(0x42));
}

TEST_CASE("An unconfirmed write is lost on rollback", "[session][rollback]")
{
    TempDir dir{"cinder-session"};
    ManualFrames frames;
    save::SaveStore store{dir.path()};
    {
        SaveSession session{localSecondPlayer(dir.path()), save::SaveSlots{}, frames};
        frames.frame = 50;
        REQUIRE(session.save(6, tagged(6)) == GuestResult::Ok);
        session.onRollback(49);
        session.onFrameConfirmed(60);
    }
    REQUIRE_FALSE(std::filesystem::exists(store.sharedPath(6)));
}

TEST_CASE("A confirmed erase deletes the file", "[session][persist]")
{
    TempDir dir{"cinder-session"};
    ManualFrames frames;
    save::SaveStore store{dir.path()};
    REQUIRE(save::SaveFile::write(store.controllerPath(0), tagged(9)).has_value());

    save::SaveSlots initial;
    REQUIRE(initial.assign(1, tagged(9)).has_value());
    SaveSession session{localSecondPlayer(dir.path()), initial, frames};

    frames.frame = 7;
    REQUIRE(session.erase(1) == GuestResult::Ok);
    REQUIRE_FALSE(session.slots().has(1));
    session.onFrameConfirmed(7);
    session.close();

    REQUIRE_FALSE(std::filesystem::exists(store.controllerPath(0)));
}

TEST_CASE("restore rejects a damaged snapshot", "[session][rollback]")
{
    TempDir dir{"cinder-session"};
    ManualFrames frames;
    SaveSession session{localSecondPlayer(dir.path()), save::SaveSlots{}, frames};
    REQUIRE(session.save(1, tagged(1)) == GuestResult::Ok);

    auto image = session.snapshot();
    image.pop_back();
    REQUIRE(session.restore(image).error().code() == core::ErrorCode::kCorruptedData);
    REQUIRE(session.slots().has(1));
}

} // namespace cinder::engine
