/**
 * @file Error.cpp
 * @brief ErrorCode name table.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "cinder/core/Error.hpp"

namespace cinder::core {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:                  return "None";
    case ErrorCode::kInvalidArgument:       return "InvalidArgument";
    case ErrorCode::kInvalidState:          return "InvalidState";
    case ErrorCode::kNotFound:              return "NotFound";
    case ErrorCode::kTimeout:               return "Timeout";
    case ErrorCode::kOutOfRange:            return "OutOfRange";
    case ErrorCode::kIoError:               return "IoError";
    case ErrorCode::kCorruptedData:         return "CorruptedData";
    case ErrorCode::kChecksumMismatch:      return "ChecksumMismatch";
    case ErrorCode::kNetworkBindFailed:     return "NetworkBindFailed";
    case ErrorCode::kNetworkSendFailed:     return "NetworkSendFailed";
    case ErrorCode::kNetworkReceiveFailed:  return "NetworkReceiveFailed";
    case ErrorCode::kNetworkDisconnected:   return "NetworkDisconnected";
    case ErrorCode::kProtocolViolation:     return "ProtocolViolation";
    case ErrorCode::kMalformedPacket:       return "MalformedPacket";
    case ErrorCode::kSaveInvalidSlot:       return "SaveInvalidSlot";
    case ErrorCode::kSaveTooLarge:          return "SaveTooLarge";
    case ErrorCode::kSaveNotOwner:          return "SaveNotOwner";
    case ErrorCode::kInternalError:         return "InternalError";
    }
    return "Unknown";
}

} // namespace cinder::core
