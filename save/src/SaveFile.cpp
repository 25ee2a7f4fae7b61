/**
 * @file SaveFile.cpp
 * @brief SaveFile implementation (POSIX durability path).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/save/SaveFile.hpp>
#include <cinder/core/Constants.hpp>
#include <cinder/math/StateHash.hpp>
#include <cinder/net/protocol/ByteStream.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace cinder::save {

namespace {

core::Unexpected ioError(const std::filesystem::path &path, std::string_view what, int err)
{
    return core::makeError(core::ErrorCode::kIoError,
                           std::format("{} '{}': {}", what, path.string(), std::strerror(err)));
}

/** @brief Writes everything to @p fd, retrying short writes and EINTR. */
bool writeAll(int fd, std::span<const core::byte> bytes)
{
    while (!bytes.empty())
    {
        const auto written = ::write(fd, bytes.data(), bytes.size());
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        bytes = bytes.subspan(static_cast<core::usize>(written));
    }
    return true;
}

} // namespace

core::Bytes SaveFile::encode(std::span<const core::byte> payload)
{
    net::protocol::ByteStream out{kHeaderSize + payload.size()};
    out.writeBytes(kMagic);
    out.writeU32(kVersion);
    out.writeU32(static_cast<core::u32>(payload.size()));
    out.writeU32(math::contentHash(payload));
    out.writeBytes(payload);
    return out.release();
}

core::Expected<core::Bytes> SaveFile::decode(std::span<const core::byte> image)
{
    if (image.size() < kHeaderSize)
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
                               std::format("save file is {} bytes, shorter than its header", image.size()));
    }

    net::protocol::ByteStream in{image};
    const auto magic = CINDER_TRY(in.readSpan(kMagic.size()));
    if (!std::ranges::equal(magic, kMagic))
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "bad save file magic");
    }

    const auto version  = CINDER_TRY(in.readU32());
    const auto length   = CINDER_TRY(in.readU32());
    const auto checksum = CINDER_TRY(in.readU32());

    if (version != kVersion)
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
                               std::format("unsupported save file version {}", version));
    }
    if (length > core::kMaxSaveSize || length != in.remaining())
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
                               std::format("save file declares {} payload bytes, holds {}", length, in.remaining()));
    }

    const auto payload = CINDER_TRY(in.readSpan(length));
    if (math::contentHash(payload) != checksum)
    {
        return core::makeError(core::ErrorCode::kChecksumMismatch, "save file checksum mismatch");
    }
    return core::Bytes(payload.begin(), payload.end());
}

core::Expected<void> SaveFile::write(const std::filesystem::path &path, std::span<const core::byte> payload)
{
    if (payload.size() > core::kMaxSaveSize)
    {
        return core::makeError(core::ErrorCode::kSaveTooLarge,
                               std::format("{} bytes exceed the {}-byte save limit", payload.size(), core::kMaxSaveSize));
    }

    if (path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            return core::makeError(core::ErrorCode::kIoError,
                                   std::format("cannot create '{}': {}", path.parent_path().string(), ec.message()));
        }
    }

    const auto image = encode(payload);
    auto tmp = path;
    tmp += ".tmp";

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        return ioError(tmp, "cannot open", errno);
    }
    if (!writeAll(fd, image) || ::fsync(fd) != 0)
    {
        const int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return ioError(tmp, "cannot write", err);
    }
    if (::close(fd) != 0)
    {
        const int err = errno;
        ::unlink(tmp.c_str());
        return ioError(tmp, "cannot close", err);
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0)
    {
        const int err = errno;
        ::unlink(tmp.c_str());
        return ioError(path, "cannot replace", err);
    }
    return {};
}

core::Expected<core::Bytes> SaveFile::read(const std::filesystem::path &path)
{
    std::ifstream file{path, std::ios::binary};
    if (!file)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return core::makeError(core::ErrorCode::kNotFound, std::format("no save at '{}'", path.string()));
        }
        return core::makeError(core::ErrorCode::kIoError, std::format("cannot open '{}'", path.string()));
    }

    // Anything past the largest legal image is corrupt; stop reading there.
    core::Bytes image;
    image.reserve(kHeaderSize + core::kMaxSaveSize);
    std::array<char, 4096> chunk{};
    while (file.read(chunk.data(), chunk.size()) || file.gcount() > 0)
    {
        const auto got = static_cast<core::usize>(file.gcount());
        std::transform(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got),
                       std::back_inserter(image), [](char c) { return static_cast<core::byte>(c); });
        if (image.size() > kHeaderSize + core::kMaxSaveSize)
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                                   std::format("'{}' exceeds the save size limit", path.string()));
        }
    }
    if (file.bad())
    {
        return core::makeError(core::ErrorCode::kIoError, std::format("cannot read '{}'", path.string()));
    }

    auto payload = decode(image);
    if (!payload)
    {
        return core::makeError(payload.error().code(),
                               std::format("'{}': {}", path.string(), payload.error().message()));
    }
    return payload;
}

core::Expected<void> SaveFile::remove(const std::filesystem::path &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("cannot delete '{}': {}", path.string(), ec.message()));
    }
    return {};
}

} // namespace cinder::save
