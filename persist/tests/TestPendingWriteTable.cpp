/**
 * @file TestPendingWriteTable.cpp
 * @brief Unit tests for the two-stage pending write table.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/persist/PendingWriteTable.hpp>

namespace cinder::persist {

namespace {

PendingWrite record(core::u32 slot, core::Frame frame, core::u8 tag)
{
    return PendingWrite{frame, slot, core::Bytes(4, static_cast<core::byte>(tag)), "slot.ncsv"};
}

} // namespace

TEST_CASE("Only confirmed writes become eligible", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(record(0, 10, 1));
    table.queue(record(1, 20, 2));

    REQUIRE(table.confirm(15) == 1);
    REQUIRE(table.eligible(0) != nullptr);
    REQUIRE(table.unconfirmed(0) == nullptr);
    REQUIRE(table.unconfirmed(1) != nullptr);
    REQUIRE(table.eligibleCount() == 1);

    const auto batch = table.takeEligible();
    REQUIRE(batch.size() == 1);
    REQUIRE(batch.front().frame == 10);
    REQUIRE(table.eligibleCount() == 0);
    REQUIRE_FALSE(table.empty());
}

TEST_CASE("Confirmation promotes the newest write of a slot", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(record(2, 10, 1));
    table.queue(record(2, 12, 2));

    REQUIRE(table.unconfirmed(2)->frame == 12);
    REQUIRE(table.confirm(12) == 1);
    REQUIRE(table.eligible(2)->data == core::Bytes(4, core::byte{2}));
}

TEST_CASE("Rollback drops writes made after the target frame", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(record(0, 100, 1));
    table.queue(record(1, 90, 2));
    REQUIRE(table.confirm(100) == 2);
    table.queue(record(0, 105, 3));

    // Confirmed but not yet flushed writes are dropped too.
    REQUIRE(table.discardAfter(95) == 2);
    REQUIRE(table.unconfirmed(0) == nullptr);
    REQUIRE(table.eligible(0) == nullptr);
    REQUIRE(table.eligible(1) != nullptr);

    REQUIRE(table.discardAfter(90) == 0);
}

TEST_CASE("Rewriting a rolled back frame keeps the new data", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(record(3, 100, 0xAA));
    REQUIRE(table.discardAfter(99) == 1);
    table.queue(record(3, 100, 0xBB));
    REQUIRE(table.confirm(100) == 1);

    const auto batch = table.takeEligible();
    REQUIRE(batch.size() == 1);
    REQUIRE(batch.front().data == core::Bytes(4, core::byte{0xBB}));
    REQUIRE(table.empty());
}

TEST_CASE("Rolling back a newer write keeps the older one pending", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(record(0, 98, 0xAA));
    table.queue(record(0, 100, 0xBB));

    REQUIRE(table.discardAfter(99) == 1);
    REQUIRE(table.unconfirmed(0)->frame == 98);

    REQUIRE(table.confirm(120) == 1);
    const auto batch = table.takeEligible();
    REQUIRE(batch.size() == 1);
    REQUIRE(batch.front().frame == 98);
    REQUIRE(batch.front().data == core::Bytes(4, core::byte{0xAA}));
    REQUIRE(table.empty());
}

TEST_CASE("A partial confirmation leaves later writes pending", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(record(1, 10, 1));
    table.queue(record(1, 20, 2));
    table.queue(record(1, 30, 3));

    REQUIRE(table.confirm(25) == 1);
    REQUIRE(table.eligible(1)->frame == 20);
    REQUIRE(table.unconfirmed(1)->frame == 30);

    // The frame 10 write was superseded and is gone for good.
    REQUIRE(table.discardAfter(25) == 1);
    REQUIRE(table.unconfirmed(1) == nullptr);
    REQUIRE(table.eligible(1)->frame == 20);
}

TEST_CASE("A write at an earlier frame replaces the later ones", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(record(2, 50, 1));
    table.queue(record(2, 40, 2));

    REQUIRE(table.unconfirmed(2)->frame == 40);
    REQUIRE(table.discardAfter(39) == 1);
    REQUIRE(table.empty());
}

TEST_CASE("requeue yields to a newer confirmed write", "[persist][table]")
{
    PendingWriteTable table;

    REQUIRE(table.requeue(record(0, 5, 1)));
    REQUIRE(table.eligible(0)->frame == 5);

    auto failed = table.takeEligible();
    table.queue(record(0, 8, 2));
    REQUIRE(table.confirm(8) == 1);

    REQUIRE_FALSE(table.requeue(std::move(failed.front())));
    REQUIRE(table.eligible(0)->frame == 8);
}

TEST_CASE("Deletes travel through the table like writes", "[persist][table]")
{
    PendingWriteTable table;
    table.queue(PendingWrite{7, 5, std::nullopt, "shared5.ncsv"});
    REQUIRE(table.confirm(7) == 1);

    const auto batch = table.takeEligible();
    REQUIRE(batch.size() == 1);
    REQUIRE_FALSE(batch.front().data.has_value());
}

} // namespace cinder::persist
