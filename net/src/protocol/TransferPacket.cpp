/**
 * @file TransferPacket.cpp
 * @brief Save-transfer packet codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/protocol/TransferPacket.hpp>
#include <cinder/net/protocol/ByteStream.hpp>
#include <cinder/core/Assert.hpp>

#include <format>

namespace cinder::net::protocol {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

[[nodiscard]] auto malformed(std::string what)
{
    return core::makeError(core::ErrorCode::kMalformedPacket, std::move(what));
}

[[nodiscard]] bool validPlayer(core::u8 player) noexcept
{
    return player < core::kMaxPlayers;
}

} // namespace

// -------------------------------------------------------------------------- //
//  Encode                                                                    //
// -------------------------------------------------------------------------- //

core::Bytes encode(const TransferPacket& packet)
{
    return std::visit(Overloaded{
        [](const AnnouncePacket& p) {
            ByteStream out{kAnnounceSize};
            out.writeU8(static_cast<core::u8>(PacketKind::Announce));
            out.writeU8(p.player);
            out.writeU32(p.totalLength);
            out.writeU32(p.hash);
            return out.release();
        },
        [](const DataPacket& p) {
            CINDER_ASSERT(p.payload.size() <= core::kChunkSize);
            CINDER_ASSERT(p.chunkIndex < p.totalChunks);
            ByteStream out{kDataHeaderSize + p.payload.size()};
            out.writeU8(static_cast<core::u8>(PacketKind::Data));
            out.writeU8(p.player);
            out.writeU16(p.sequence);
            out.writeU16(p.chunkIndex);
            out.writeU16(p.totalChunks);
            out.writeU16(static_cast<core::u16>(p.payload.size()));
            out.writeBytes(p.payload);
            return out.release();
        },
        [](const AckPacket& p) {
            ByteStream out{kAckSize};
            out.writeU8(static_cast<core::u8>(PacketKind::Ack));
            out.writeU8(p.player);
            out.writeU16(p.lastSequence);
            out.writeU32(p.ackBits);
            return out.release();
        },
        [](const ReadyPacket& p) {
            ByteStream out{kReadySize};
            out.writeU8(static_cast<core::u8>(PacketKind::Ready));
            out.writeU8(p.player);
            return out.release();
        },
        [](const ErrorPacket& p) {
            ByteStream out{kErrorSize};
            out.writeU8(static_cast<core::u8>(PacketKind::Error));
            out.writeU8(static_cast<core::u8>(p.code));
            out.writeU8(p.player);
            return out.release();
        },
    }, packet);
}

// -------------------------------------------------------------------------- //
//  Decode                                                                    //
// -------------------------------------------------------------------------- //

std::optional<PacketKind> peekKind(std::span<const core::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return std::nullopt;
    }
    const auto tag = static_cast<core::u8>(bytes.front());
    if (tag < static_cast<core::u8>(PacketKind::Announce) || tag > static_cast<core::u8>(PacketKind::Error))
    {
        return std::nullopt;
    }
    return static_cast<PacketKind>(tag);
}

core::Expected<TransferPacket> decode(std::span<const core::byte> bytes)
{
    const auto kind = peekKind(bytes);
    if (!kind)
    {
        return malformed(bytes.empty() ? "empty datagram" : "unknown packet tag");
    }

    auto expectSize = [&](core::usize expected) {
        return bytes.size() == expected;
    };

    ByteStream in{bytes};
    (void)in.readU8(); // tag, already inspected

    switch (*kind)
    {
    case PacketKind::Announce:
    {
        if (!expectSize(kAnnounceSize))
            return malformed(std::format("announce must be {} bytes, got {}", kAnnounceSize, bytes.size()));
        AnnouncePacket p;
        p.player      = *in.readU8();
        p.totalLength = *in.readU32();
        p.hash        = *in.readU32();
        if (!validPlayer(p.player))
            return malformed("announce from unknown player");
        return TransferPacket{p};
    }
    case PacketKind::Data:
    {
        if (bytes.size() < kDataHeaderSize)
            return malformed("truncated data header");
        DataPacket p;
        p.player      = *in.readU8();
        p.sequence    = *in.readU16();
        p.chunkIndex  = *in.readU16();
        p.totalChunks = *in.readU16();
        const core::u16 chunkLen = *in.readU16();
        if (!validPlayer(p.player))
            return malformed("data from unknown player");
        if (chunkLen != in.remaining())
            return malformed(std::format("chunk_len {} disagrees with {} payload bytes", chunkLen, in.remaining()));
        if (chunkLen > core::kChunkSize)
            return malformed("chunk exceeds chunk size");
        if (p.chunkIndex >= p.totalChunks)
            return malformed("chunk index out of range");
        const auto payload = *in.readSpan(chunkLen);
        p.payload.assign(payload.begin(), payload.end());
        return TransferPacket{std::move(p)};
    }
    case PacketKind::Ack:
    {
        if (!expectSize(kAckSize))
            return malformed(std::format("ack must be {} bytes, got {}", kAckSize, bytes.size()));
        AckPacket p;
        p.player       = *in.readU8();
        p.lastSequence = *in.readU16();
        p.ackBits      = *in.readU32();
        if (!validPlayer(p.player))
            return malformed("ack from unknown player");
        return TransferPacket{p};
    }
    case PacketKind::Ready:
    {
        if (!expectSize(kReadySize))
            return malformed("ready must be 2 bytes");
        ReadyPacket p;
        p.player = *in.readU8();
        if (!validPlayer(p.player))
            return malformed("ready from unknown player");
        return TransferPacket{p};
    }
    case PacketKind::Error:
    {
        if (!expectSize(kErrorSize))
            return malformed("error must be 3 bytes");
        const core::u8 code = *in.readU8();
        ErrorPacket p;
        p.player = *in.readU8();
        if (!isValidSyncError(code))
            return malformed("unknown error code");
        if (!validPlayer(p.player))
            return malformed("error from unknown player");
        p.code = static_cast<SyncError>(code);
        return TransferPacket{p};
    }
    }

    return malformed("unknown packet tag");
}

core::u8 senderOf(const TransferPacket& packet) noexcept
{
    return std::visit([](const auto& p) { return p.player; }, packet);
}

} // namespace cinder::net::protocol
