/**
 * @file TestStateHash.cpp
 * @brief FNV-1a digests against published reference values.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/math/StateHash.hpp>

#include <array>
#include <string_view>

namespace cinder::math {

namespace {

std::span<const core::byte> bytesOf(std::string_view text)
{
    return std::as_bytes(std::span{text.data(), text.size()});
}

} // namespace

TEST_CASE("FNV-1a 64 matches the reference vectors", "[math][hash]")
{
    REQUIRE(StateHash{}.digest() == 0xcbf29ce484222325ULL);
    REQUIRE(StateHash{}.hashBytes(bytesOf("a")).digest() == 0xaf63dc4c8601ec8cULL);
    REQUIRE(StateHash{}.hashBytes(bytesOf("foobar")).digest() == 0x85944171f73967e8ULL);
}

TEST_CASE("The 32-bit fold XORs both halves", "[math][hash]")
{
    REQUIRE(contentHash({}) == 0x4fd0bfc1u);
    REQUIRE(contentHash(bytesOf("a")) == 0x296230c0u);
    REQUIRE(contentHash(bytesOf("foobar")) == 0x72ad2699u);
}

TEST_CASE("Hashing is incremental and resettable", "[math][hash]")
{
    StateHash split;
    split.hashBytes(bytesOf("foo")).hashBytes(bytesOf("bar"));
    REQUIRE(split.digest() == StateHash{}.hashBytes(bytesOf("foobar")).digest());

    split.reset();
    REQUIRE(split.digest() == StateHash::kOffsetBasis);
}

TEST_CASE("Integers are combined little-endian", "[math][hash]")
{
    StateHash integer;
    integer.combine(core::u16{0x1234});

    const std::array<core::byte, 2> raw{core::byte{0x34}, core::byte{0x12}};
    REQUIRE(integer.digest() == StateHash{}.hashBytes(raw).digest());
}

} // namespace cinder::math
