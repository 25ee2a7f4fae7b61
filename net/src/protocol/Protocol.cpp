/**
 * @file Protocol.cpp
 * @brief SyncError helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/protocol/Protocol.hpp>

namespace cinder::net::protocol {

std::string_view describe(SyncError error) noexcept
{
    switch (error)
    {
    case SyncError::TooLarge:        return "announced save exceeds the per-player size limit";
    case SyncError::Timeout:         return "save synchronization timed out";
    case SyncError::HashMismatch:    return "received save failed content verification";
    case SyncError::Disconnected:    return "peer disconnected during save transfer";
    case SyncError::ProtocolError:   return "peer violated the save transfer protocol";
    case SyncError::MalformedPacket: return "malformed save transfer packet";
    }
    return "unknown save synchronization error";
}

core::ErrorCode toErrorCode(SyncError error) noexcept
{
    switch (error)
    {
    case SyncError::TooLarge:        return core::ErrorCode::kSaveTooLarge;
    case SyncError::Timeout:         return core::ErrorCode::kTimeout;
    case SyncError::HashMismatch:    return core::ErrorCode::kChecksumMismatch;
    case SyncError::Disconnected:    return core::ErrorCode::kNetworkDisconnected;
    case SyncError::ProtocolError:   return core::ErrorCode::kProtocolViolation;
    case SyncError::MalformedPacket: return core::ErrorCode::kMalformedPacket;
    }
    return core::ErrorCode::kInternalError;
}

} // namespace cinder::net::protocol
