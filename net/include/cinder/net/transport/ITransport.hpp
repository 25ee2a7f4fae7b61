// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract datagram transport (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cinder/core/Types.hpp>
#include <cinder/core/Expected.hpp>

#include <span>

namespace cinder::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Unreliable, unordered datagram channel shared by the rollback
///        traffic and the save synchronization.
///
/// Concrete implementations:
///   - @c SocketTransport: POSIX UDP sockets.
///   - test doubles delivering through in-memory queues.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Opens the transport (bind, etc.).
    [[nodiscard]] virtual core::Expected<void> open() = 0;

    /// @brief Closes the transport.
    virtual void close() = 0;

    /// @brief Sends one datagram to the given address.
    /// @param data    Datagram bytes.
    /// @param address Opaque address owned by the caller's peer table.
    /// @return Number of bytes sent, or error.
    [[nodiscard]] virtual core::Expected<core::u32> send(
        std::span<const core::byte> data,
        const void* address) = 0;

    /// @brief Non-blocking receive.
    /// @param buffer  Destination buffer.
    /// @param[out] fromAddress Filled with the sender address; may be null.
    /// @return Number of bytes received (0 if nothing available), or error.
    [[nodiscard]] virtual core::Expected<core::u32> receive(
        std::span<core::byte> buffer,
        void* fromAddress) = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace cinder::net::transport
