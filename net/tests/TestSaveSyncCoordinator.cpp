/**
 * @file TestSaveSyncCoordinator.cpp
 * @brief Unit tests for the multi-player save sync coordinator.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/net/sync/SaveSyncCoordinator.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/math/StateHash.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace cinder::net::sync {

using namespace std::chrono_literals;

namespace {

const TimePoint kT0{};

core::Bytes makeSave(core::usize size, core::u8 seed)
{
    core::Bytes bytes(size);
    for (core::usize i = 0; i < size; ++i)
        bytes[i] = static_cast<core::byte>((i * 13 + seed) & 0xFF);
    return bytes;
}

/// Every coordinator of a session wired together in memory.
struct Mesh
{
    using Filter = std::function<bool(core::u8 from, core::u8 to, const core::Bytes &)>;

    std::vector<std::unique_ptr<SaveSyncCoordinator>> peers;
    Filter filter = [](core::u8, core::u8, const core::Bytes &) { return true; };

    Mesh(core::u8 count, const SyncConfig &config)
    {
        for (core::u8 i = 0; i < count; ++i)
            peers.push_back(std::make_unique<SaveSyncCoordinator>(count, config));
    }

    void start(std::vector<std::optional<core::Bytes>> saves, TimePoint now)
    {
        std::vector<std::vector<OutgoingPacket>> initial;
        for (core::u8 i = 0; i < peers.size(); ++i)
        {
            auto packets = peers[i]->startSync(i, std::move(saves[i]), now);
            REQUIRE(packets.has_value());
            initial.push_back(std::move(*packets));
        }
        for (core::u8 i = 0; i < peers.size(); ++i)
            deliver(i, initial[i], now);
        settle(now);
    }

    void advance(TimePoint now)
    {
        for (auto &peer : peers)
            (void) peer->tick(now);
        settle(now);
    }

    void settle(TimePoint now)
    {
        for (int round = 0; round < 1000; ++round)
        {
            bool any = false;
            for (core::u8 i = 0; i < peers.size(); ++i)
            {
                auto packets = peers[i]->drainOutgoing();
                any = any || !packets.empty();
                deliver(i, packets, now);
            }
            if (!any)
                return;
        }
        FAIL("mesh never went quiet");
    }

    void deliver(core::u8 from, const std::vector<OutgoingPacket> &packets, TimePoint now)
    {
        for (const auto &packet : packets)
        {
            for (core::u8 to = 0; to < peers.size(); ++to)
            {
                if (to == from || (packet.target != kBroadcast && packet.target != to))
                    continue;
                if (filter(from, to, packet.bytes))
                    (void) peers[to]->handlePacket(packet.bytes, now);
            }
        }
    }

    bool allComplete() const
    {
        for (const auto &peer : peers)
            if (!peer->result().isComplete())
                return false;
        return true;
    }
};

bool isReady(const core::Bytes &bytes)
{
    return protocol::peekKind(bytes) == protocol::PacketKind::Ready;
}

} // namespace

TEST_CASE("Three players end up with identical save tables", "[coordinator]")
{
    Mesh mesh{3, SyncConfig{}};
    const auto save0 = makeSave(20 * 1024, 1);
    const auto save2 = makeSave(300, 2);

    mesh.start({save0, std::nullopt, save2}, kT0);

    REQUIRE(mesh.allComplete());

    for (const auto &peer : mesh.peers)
    {
        save::SaveSlots slots;
        REQUIRE(peer->populate(slots).has_value());

        const auto slot0 = slots.read(0);
        REQUIRE(slot0.has_value());
        REQUIRE(core::Bytes(slot0->begin(), slot0->end()) == save0);
        REQUIRE_FALSE(slots.has(1));
        const auto slot2 = slots.read(2);
        REQUIRE(slot2.has_value());
        REQUIRE(core::Bytes(slot2->begin(), slot2->end()) == save2);
        REQUIRE_FALSE(slots.has(3));
    }
}

TEST_CASE("populate writes the same table every time", "[coordinator]")
{
    Mesh mesh{2, SyncConfig{}};
    const auto save1 = makeSave(50, 7);
    mesh.start({std::nullopt, save1}, kT0);
    REQUIRE(mesh.allComplete());

    auto &coordinator = *mesh.peers[0];
    save::SaveSlots first;
    save::SaveSlots second;
    REQUIRE(coordinator.populate(first).has_value());
    REQUIRE(coordinator.populate(second).has_value());

    for (const auto *slots : {&first, &second})
    {
        REQUIRE_FALSE(slots->has(0));
        const auto slot1 = slots->read(1);
        REQUIRE(slot1.has_value());
        REQUIRE(core::Bytes(slot1->begin(), slot1->end()) == save1);
    }
}

TEST_CASE("Completion waits for Ready from every peer", "[coordinator][ready]")
{
    SyncConfig config;
    Mesh mesh{2, config};

    bool blockReady = true;
    mesh.filter = [&](core::u8 from, core::u8 to, const core::Bytes &bytes) {
        return !(blockReady && from == 1 && to == 0 && isReady(bytes));
    };

    mesh.start({makeSave(100, 3), makeSave(200, 4)}, kT0);

    const auto &p0 = *mesh.peers[0];
    REQUIRE(p0.sender(1)->state() == StreamState::Complete);
    REQUIRE(p0.receiver(1)->state() == StreamState::Complete);
    REQUIRE(p0.readySent());
    REQUIRE_FALSE(p0.readyFrom(1));
    REQUIRE(p0.result().status == SyncResult::Status::Continue);
    REQUIRE(mesh.peers[1]->result().isComplete());

    save::SaveSlots early;
    REQUIRE_FALSE(mesh.peers[0]->populate(early).has_value());

    // Our periodic Ready draws a reply from the finished peer.
    blockReady = false;
    mesh.advance(kT0 + config.readyInterval);

    REQUIRE(p0.readyFrom(1));
    REQUIRE(mesh.allComplete());
}

TEST_CASE("An Error packet from a peer aborts the sync", "[coordinator][error]")
{
    Mesh mesh{2, SyncConfig{}};
    mesh.filter = [](core::u8, core::u8, const core::Bytes &) { return false; };
    mesh.start({makeSave(10, 1), makeSave(10, 2)}, kT0);

    auto &coordinator = *mesh.peers[0];
    const auto result = coordinator.handlePacket(
        protocol::encode(protocol::ErrorPacket{SyncError::HashMismatch, 1}), kT0 + 1ms);

    REQUIRE(result.isError());
    REQUIRE(result.error == SyncError::HashMismatch);
    REQUIRE(result.origin == 1);
    REQUIRE(coordinator.sender(1)->state() == StreamState::Failed);
    REQUIRE(coordinator.receiver(1)->state() == StreamState::Failed);

    save::SaveSlots slots;
    const auto populated = coordinator.populate(slots);
    REQUIRE_FALSE(populated.has_value());
    REQUIRE(populated.error().code() == core::ErrorCode::kInvalidState);

    // Terminal: later traffic changes nothing.
    REQUIRE(coordinator.tick(kT0 + 1s).isError());
}

TEST_CASE("The global timeout aborts a sync that never progresses", "[coordinator][timeout]")
{
    SyncConfig config;
    config.maxRetransmits     = 1000;
    config.peerSilenceTimeout = config.syncTimeout * 2;
    SaveSyncCoordinator coordinator{2, config};

    auto initial = coordinator.startSync(0, makeSave(64, 9), kT0);
    REQUIRE(initial.has_value());
    REQUIRE(initial->size() == 1);
    REQUIRE(protocol::peekKind(initial->front().bytes) == protocol::PacketKind::Announce);
    REQUIRE(initial->front().target == 1);

    REQUIRE(coordinator.tick(kT0 + config.syncTimeout - 1ms).status == SyncResult::Status::Continue);
    (void) coordinator.drainOutgoing();

    const auto result = coordinator.tick(kT0 + config.syncTimeout);
    REQUIRE(result.isError());
    REQUIRE(result.error == SyncError::Timeout);
    REQUIRE(result.origin == 0);

    const auto outgoing = coordinator.drainOutgoing();
    REQUIRE_FALSE(outgoing.empty());
    for (const auto &packet : outgoing)
    {
        REQUIRE(packet.target == kBroadcast);
        REQUIRE(packet.bytes == protocol::encode(protocol::ErrorPacket{SyncError::Timeout, 0}));
    }
}

TEST_CASE("A local stream failure is broadcast as an Error", "[coordinator][error]")
{
    SaveSyncCoordinator coordinator{2, SyncConfig{}};
    REQUIRE(coordinator.startSync(0, std::nullopt, kT0).has_value());

    const auto announce = protocol::encode(
        protocol::AnnouncePacket{1, static_cast<core::u32>(core::kMaxSaveSize + 1), 5});
    const auto result = coordinator.handlePacket(announce, kT0 + 1ms);

    REQUIRE(result.isError());
    REQUIRE(result.error == SyncError::TooLarge);
    REQUIRE(result.origin == 0);

    bool broadcast = false;
    for (const auto &packet : coordinator.drainOutgoing())
        broadcast = broadcast || (packet.target == kBroadcast
                                  && packet.bytes == protocol::encode(protocol::ErrorPacket{SyncError::TooLarge, 0}));
    REQUIRE(broadcast);
}

TEST_CASE("abort cancels every stream and tells the peers", "[coordinator][error]")
{
    Mesh mesh{3, SyncConfig{}};
    mesh.filter = [](core::u8 from, core::u8, const core::Bytes &) { return from != 0; };
    mesh.start({makeSave(30 * 1024, 1), makeSave(10, 2), std::nullopt}, kT0);

    auto &coordinator = *mesh.peers[0];
    mesh.filter = [](core::u8, core::u8, const core::Bytes &) { return true; };
    coordinator.abort(SyncError::Disconnected);

    REQUIRE(coordinator.result().isError());
    REQUIRE(coordinator.result().error == SyncError::Disconnected);
    REQUIRE(coordinator.result().origin == 0);
    for (core::u8 player = 1; player < 3; ++player)
    {
        REQUIRE(coordinator.sender(player)->state() == StreamState::Failed);
        REQUIRE(coordinator.receiver(player)->state() == StreamState::Failed);
    }

    mesh.settle(kT0 + 1ms);
    for (core::u8 player = 1; player < 3; ++player)
    {
        const auto result = mesh.peers[player]->result();
        REQUIRE(result.isError());
        REQUIRE(result.error == SyncError::Disconnected);
        REQUIRE(result.origin == 0);
    }

    // A second abort keeps the first reason.
    coordinator.abort(SyncError::Timeout);
    REQUIRE(coordinator.result().error == SyncError::Disconnected);
}

TEST_CASE("Malformed and spoofed datagrams are dropped", "[coordinator]")
{
    SaveSyncCoordinator coordinator{2, SyncConfig{}};
    REQUIRE(coordinator.startSync(0, makeSave(10, 1), kT0).has_value());
    (void) coordinator.drainOutgoing();

    const core::Bytes garbage{core::byte{0x02}, core::byte{0x01}};
    REQUIRE(coordinator.handlePacket(garbage, kT0).status == SyncResult::Status::Continue);

    // Claims to come from ourselves.
    REQUIRE(coordinator.handlePacket(protocol::encode(protocol::ReadyPacket{0}), kT0).status
            == SyncResult::Status::Continue);
    // Player 3 is not part of a two-player session.
    REQUIRE(coordinator.handlePacket(protocol::encode(protocol::ErrorPacket{SyncError::Timeout, 3}), kT0).status
            == SyncResult::Status::Continue);

    REQUIRE_FALSE(coordinator.readyFrom(0));
    REQUIRE(coordinator.drainOutgoing().empty());
}

TEST_CASE("A finished peer keeps answering late packets", "[coordinator]")
{
    Mesh mesh{2, SyncConfig{}};
    const auto save1 = makeSave(500, 7);
    mesh.start({makeSave(100, 6), save1}, kT0);
    REQUIRE(mesh.allComplete());

    auto &coordinator = *mesh.peers[0];
    const auto lateAnnounce = protocol::encode(
        protocol::AnnouncePacket{1, static_cast<core::u32>(save1.size()), math::contentHash(save1)});
    REQUIRE(coordinator.handlePacket(lateAnnounce, kT0 + 1s).isComplete());

    const auto replies = coordinator.drainOutgoing();
    REQUIRE(replies.size() == 1);
    REQUIRE(replies.front().target == 1);
    REQUIRE(replies.front().bytes
            == protocol::encode(protocol::AckPacket{0, protocol::kControlSequence, protocol::kAckVerified}));

    REQUIRE(coordinator.handlePacket(protocol::encode(protocol::ReadyPacket{1}), kT0 + 1s).isComplete());
    const auto ready = coordinator.drainOutgoing();
    REQUIRE(ready.size() == 1);
    REQUIRE(ready.front().target == 1);
    REQUIRE(isReady(ready.front().bytes));
}

TEST_CASE("A single-player session completes immediately", "[coordinator]")
{
    SaveSyncCoordinator coordinator{1, SyncConfig{}};
    const auto save = makeSave(42, 5);

    auto initial = coordinator.startSync(0, save, kT0);
    REQUIRE(initial.has_value());
    REQUIRE(coordinator.result().isComplete());

    save::SaveSlots slots;
    REQUIRE(coordinator.populate(slots).has_value());
    REQUIRE(slots.has(0));
}

TEST_CASE("startSync validates its arguments", "[coordinator]")
{
    SECTION("local player outside the session")
    {
        SaveSyncCoordinator coordinator{2, SyncConfig{}};
        const auto started = coordinator.startSync(2, std::nullopt, kT0);
        REQUIRE_FALSE(started.has_value());
        REQUIRE(started.error().code() == core::ErrorCode::kInvalidArgument);
    }
    SECTION("oversized local save")
    {
        SaveSyncCoordinator coordinator{2, SyncConfig{}};
        const auto started = coordinator.startSync(0, core::Bytes(core::kMaxSaveSize + 1), kT0);
        REQUIRE_FALSE(started.has_value());
        REQUIRE(started.error().code() == core::ErrorCode::kSaveTooLarge);
    }
    SECTION("started twice")
    {
        SaveSyncCoordinator coordinator{2, SyncConfig{}};
        REQUIRE(coordinator.startSync(0, std::nullopt, kT0).has_value());
        REQUIRE_FALSE(coordinator.startSync(0, std::nullopt, kT0).has_value());
    }
}

} // namespace cinder::net::sync
