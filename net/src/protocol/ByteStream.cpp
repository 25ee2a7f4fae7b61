/**
 * @file ByteStream.cpp
 * @brief ByteStream implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/protocol/ByteStream.hpp>
#include <cinder/core/Assert.hpp>

namespace cinder::net::protocol {

ByteStream::ByteStream() noexcept = default;

ByteStream::ByteStream(core::usize capacity)
{
    _buffer.reserve(capacity);
}

ByteStream::ByteStream(std::span<const core::byte> data) noexcept
    : _source{data}
    , _readOnly{true}
{}

ByteStream::~ByteStream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void ByteStream::writeU8(core::u8 value)
{
    CINDER_ASSERT(!_readOnly);
    _buffer.push_back(static_cast<core::byte>(value));
}

void ByteStream::writeU16(core::u16 value)
{
    writeU8(static_cast<core::u8>(value & 0xFFu));
    writeU8(static_cast<core::u8>(value >> 8));
}

void ByteStream::writeU32(core::u32 value)
{
    writeU16(static_cast<core::u16>(value & 0xFFFFu));
    writeU16(static_cast<core::u16>(value >> 16));
}

void ByteStream::writeBytes(std::span<const core::byte> bytes)
{
    CINDER_ASSERT(!_readOnly);
    _buffer.insert(_buffer.end(), bytes.begin(), bytes.end());
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

core::Expected<core::u8> ByteStream::readU8()
{
    const auto src = data();
    if (_readPos + 1 > src.size())
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "ByteStream underflow");
    }
    return static_cast<core::u8>(src[_readPos++]);
}

core::Expected<core::u16> ByteStream::readU16()
{
    if (remaining() < 2)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "ByteStream underflow");
    }
    const auto lo = CINDER_TRY(readU8());
    const auto hi = CINDER_TRY(readU8());
    return static_cast<core::u16>(lo | (static_cast<core::u16>(hi) << 8));
}

core::Expected<core::u32> ByteStream::readU32()
{
    if (remaining() < 4)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "ByteStream underflow");
    }
    const auto lo = CINDER_TRY(readU16());
    const auto hi = CINDER_TRY(readU16());
    return static_cast<core::u32>(lo) | (static_cast<core::u32>(hi) << 16);
}

core::Expected<std::span<const core::byte>> ByteStream::readSpan(core::usize count)
{
    const auto src = data();
    if (count > remaining())
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "ByteStream underflow");
    }
    auto view = src.subspan(_readPos, count);
    _readPos += count;
    return view;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::usize ByteStream::size() const noexcept { return _buffer.size(); }

core::usize ByteStream::remaining() const noexcept
{
    const auto total = data().size();
    return (total > _readPos) ? total - _readPos : 0;
}

std::span<const core::byte> ByteStream::data() const noexcept
{
    return _readOnly ? _source : std::span<const core::byte>{_buffer};
}

core::Bytes ByteStream::release() noexcept
{
    return std::move(_buffer);
}

} // namespace cinder::net::protocol
