/**
 * @file TestSaveFile.cpp
 * @brief Unit tests for the on-disk save format.
 */

#include <catch2/catch_test_macros.hpp>

#include <cinder/save/SaveFile.hpp>
#include <cinder/core/Constants.hpp>

#include "TempDir.hpp"

#include <filesystem>
#include <fstream>

namespace cinder::save {

using tests::TempDir;

namespace {

core::Bytes payloadOf(core::usize size)
{
    core::Bytes bytes(size);
    for (core::usize i = 0; i < size; ++i)
        bytes[i] = static_cast<core::byte>(i * 31 + 7);
    return bytes;
}

void writeRaw(const std::filesystem::path &path, const core::Bytes &bytes)
{
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

} // namespace

TEST_CASE("Header carries magic, version, length and checksum", "[save][file]")
{
    const auto payload = payloadOf(5);
    const auto image   = SaveFile::encode(payload);

    REQUIRE(image.size() == SaveFile::kHeaderSize + payload.size());
    REQUIRE(image[0] == core::byte{'N'});
    REQUIRE(image[3] == core::byte{'V'});
    REQUIRE(image[4] == core::byte{2});
    REQUIRE(image[8] == core::byte{5});

    const auto decoded = SaveFile::decode(image);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == payload);
}

TEST_CASE("decode reports each kind of damage", "[save][file]")
{
    auto image = SaveFile::encode(payloadOf(64));

    SECTION("short image")
    {
        const auto result = SaveFile::decode(std::span{image}.first(SaveFile::kHeaderSize - 1));
        REQUIRE(result.error().code() == core::ErrorCode::kCorruptedData);
    }
    SECTION("magic")
    {
        image[1] = core::byte{'X'};
        REQUIRE(SaveFile::decode(image).error().code() == core::ErrorCode::kCorruptedData);
    }
    SECTION("version")
    {
        image[4] = core::byte{1};
        REQUIRE(SaveFile::decode(image).error().code() == core::ErrorCode::kCorruptedData);
    }
    SECTION("length disagrees with the payload")
    {
        image.pop_back();
        REQUIRE(SaveFile::decode(image).error().code() == core::ErrorCode::kCorruptedData);
    }
    SECTION("payload bit flip")
    {
        image[SaveFile::kHeaderSize + 10] ^= core::byte{0x01};
        REQUIRE(SaveFile::decode(image).error().code() == core::ErrorCode::kChecksumMismatch);
    }
}

TEST_CASE("write then read returns the payload", "[save][file]")
{
    TempDir dir;
    const auto path    = dir.path() / "nested" / "controller0.ncsv";
    const auto payload = payloadOf(core::kChunkSize * 2 + 17);

    REQUIRE(SaveFile::write(path, payload).has_value());
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    const auto loaded = SaveFile::read(path);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == payload);

    // Overwrite replaces the previous contents wholesale.
    REQUIRE(SaveFile::write(path, payloadOf(3)).has_value());
    REQUIRE(SaveFile::read(path)->size() == 3);
}

TEST_CASE("An empty payload is a valid save", "[save][file]")
{
    TempDir dir;
    const auto path = dir.path() / "empty.ncsv";

    REQUIRE(SaveFile::write(path, core::Bytes{}).has_value());
    const auto loaded = SaveFile::read(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->empty());
}

TEST_CASE("read distinguishes missing from corrupt files", "[save][file]")
{
    TempDir dir;

    REQUIRE(SaveFile::read(dir.path() / "missing.ncsv").error().code() == core::ErrorCode::kNotFound);

    const auto garbage = dir.path() / "garbage.ncsv";
    writeRaw(garbage, core::Bytes(40, core::byte{0x5A}));
    REQUIRE(SaveFile::read(garbage).error().code() == core::ErrorCode::kCorruptedData);

    const auto huge = dir.path() / "huge.ncsv";
    writeRaw(huge, core::Bytes(SaveFile::kHeaderSize + core::kMaxSaveSize + 1, core::byte{0}));
    REQUIRE(SaveFile::read(huge).error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("write refuses oversize payloads", "[save][file]")
{
    TempDir dir;
    const auto path = dir.path() / "big.ncsv";

    const auto result = SaveFile::write(path, core::Bytes(core::kMaxSaveSize + 1));
    REQUIRE(result.error().code() == core::ErrorCode::kSaveTooLarge);
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("remove tolerates a missing file", "[save][file]")
{
    TempDir dir;
    const auto path = dir.path() / "gone.ncsv";

    REQUIRE(SaveFile::write(path, payloadOf(8)).has_value());
    REQUIRE(SaveFile::remove(path).has_value());
    REQUIRE_FALSE(std::filesystem::exists(path));
    REQUIRE(SaveFile::remove(path).has_value());
}

} // namespace cinder::save
