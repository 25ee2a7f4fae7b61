/**
 * @file SocketTransport.hpp
 * @brief Standard POSIX UDP socket transport.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_NET_TRANSPORT_SOCKETTRANSPORT_HPP
    #define CINDER_NET_TRANSPORT_SOCKETTRANSPORT_HPP

#include <cinder/net/transport/ITransport.hpp>
#include <cinder/core/NonCopyable.hpp>

#include <memory>
#include <string_view>

namespace cinder::net::transport {

/**
 * @class SocketTransport
 * @brief POSIX UDP socket-based transport (non-blocking).
 *
 * Binds to a local port on @ref open and uses @c sendto / @c recvfrom
 * for packet exchange.  Addresses are @c sockaddr_in.
 */
class SocketTransport final : public ITransport,
                              public core::NonCopyable<SocketTransport>
{
public:
    /**
     * @brief Constructs a socket transport bound to the given port.
     * @param port Local UDP port, 0 for an ephemeral one.
     */
    explicit SocketTransport(core::u16 port);
    ~SocketTransport() override;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> send(
        std::span<const core::byte> data,
        const void* address) override;

    [[nodiscard]] core::Expected<core::u32> receive(
        std::span<core::byte> buffer,
        void* fromAddress) override;

    [[nodiscard]] const char* name() const noexcept override;

    /** @brief Port actually bound, 0 while closed. */
    [[nodiscard]] core::u16 boundPort() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/**
 * @brief Size of the opaque address SocketTransport expects.
 */
[[nodiscard]] core::usize socketAddressSize() noexcept;

/**
 * @brief Parses "a.b.c.d:port" into the sockaddr_in pointed to by @p out.
 *
 * @p out must provide socketAddressSize() bytes.
 */
[[nodiscard]] core::Expected<void> parseSocketAddress(std::string_view text, void* out);

} // namespace cinder::net::transport

#endif // CINDER_NET_TRANSPORT_SOCKETTRANSPORT_HPP
