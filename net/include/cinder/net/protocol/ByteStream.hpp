/**
 * @file ByteStream.hpp
 * @brief Byte-aligned little-endian serialization stream.
 *
 * Every fixed binary layout in the console (transfer packets, the slot
 * table snapshot, save file headers) is written and parsed through this
 * class, field by field, so no layout depends on struct packing or host
 * endianness.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_PROTOCOL_BYTESTREAM_HPP
    #define CINDER_NET_PROTOCOL_BYTESTREAM_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Expected.hpp>
#include <cinder/core/NonCopyable.hpp>

#include <span>
#include <vector>

namespace cinder::net::protocol {

/**
 * @class ByteStream
 * @brief Sequential little-endian reader / writer.
 *
 * A default-constructed stream is writable and owns its buffer.  A stream
 * constructed from a span is read-only and only views the caller's bytes;
 * the span must outlive the stream.
 */
class ByteStream final : public core::NonCopyable<ByteStream>
{
public:
    /** @brief Constructs an empty writable stream. */
    ByteStream() noexcept;

    /**
     * @brief Constructs an empty writable stream with reserved capacity.
     * @param capacity Bytes to reserve up front.
     */
    explicit ByteStream(core::usize capacity);

    /**
     * @brief Constructs a read-only stream over existing bytes.
     * @param data Raw bytes to parse.
     */
    explicit ByteStream(std::span<const core::byte> data) noexcept;

    ~ByteStream();

    ByteStream(ByteStream&&) noexcept            = default;
    ByteStream& operator=(ByteStream&&) noexcept = default;

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);

    /** @brief Appends raw bytes verbatim. */
    void writeBytes(std::span<const core::byte> bytes);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();

    /**
     * @brief Returns a view of the next @p count bytes and advances.
     *
     * The view aliases the stream's source and is only valid while that
     * source is alive.
     */
    [[nodiscard]] core::Expected<std::span<const core::byte>> readSpan(core::usize count);

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /** @brief Number of bytes written so far. */
    [[nodiscard]] core::usize size() const noexcept;

    /** @brief Bytes left to read. */
    [[nodiscard]] core::usize remaining() const noexcept;

    /** @brief Written bytes (writable) or the viewed source (read-only). */
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /** @brief Moves the written buffer out of the stream. */
    [[nodiscard]] core::Bytes release() noexcept;

private:
    core::Bytes                   _buffer;
    std::span<const core::byte>   _source;
    core::usize                   _readPos{0};
    bool                          _readOnly{false};
};

} // namespace cinder::net::protocol

#endif // CINDER_NET_PROTOCOL_BYTESTREAM_HPP
