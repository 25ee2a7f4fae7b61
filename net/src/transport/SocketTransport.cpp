/**
 * @file SocketTransport.cpp
 * @brief POSIX UDP socket transport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/transport/SocketTransport.hpp>
#include <cinder/core/Log.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace cinder::net::transport {

struct SocketTransport::Impl
{
    core::u16 port;
    core::u16 boundPort{0};
    int       fd{-1};

    explicit Impl(core::u16 p) : port{p} {}
};

SocketTransport::SocketTransport(core::u16 port)
    : _impl{std::make_unique<Impl>(port)}
{}

SocketTransport::~SocketTransport()
{
    close();
}

core::Expected<void> SocketTransport::open()
{
    if (_impl->fd >= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket already open");
    }

    _impl->fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kNetworkBindFailed,
                               std::format("socket() failed: {}", std::strerror(errno)));
    }

    const int flags = ::fcntl(_impl->fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(_impl->fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        ::close(_impl->fd);
        _impl->fd = -1;
        return core::makeError(core::ErrorCode::kNetworkBindFailed, "fcntl(O_NONBLOCK) failed");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_impl->port);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (::bind(_impl->fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        const int err = errno;
        ::close(_impl->fd);
        _impl->fd = -1;
        return core::makeError(core::ErrorCode::kNetworkBindFailed,
                               std::format("bind() to port {} failed: {}", _impl->port, std::strerror(err)));
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(_impl->fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0)
    {
        _impl->boundPort = ntohs(bound.sin_port);
    }

    core::Log::info("SocketTransport", std::format("bound to port {}", _impl->boundPort));
    return {};
}

void SocketTransport::close()
{
    if (_impl->fd >= 0)
    {
        ::close(_impl->fd);
        _impl->fd = -1;
        _impl->boundPort = 0;
    }
}

core::Expected<core::u32> SocketTransport::send(
    std::span<const core::byte> data,
    const void* address)
{
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket not open");
    }

    const auto* addr = static_cast<const sockaddr_in*>(address);
    const auto sent = ::sendto(_impl->fd,
                               data.data(),
                               data.size(),
                               0,
                               reinterpret_cast<const sockaddr*>(addr),
                               sizeof(sockaddr_in));

    if (sent < 0)
    {
        return core::makeError(core::ErrorCode::kNetworkSendFailed,
                               std::format("sendto() failed: {}", std::strerror(errno)));
    }

    return static_cast<core::u32>(sent);
}

core::Expected<core::u32> SocketTransport::receive(
    std::span<core::byte> buffer,
    void* fromAddress)
{
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket not open");
    }

    sockaddr_in scratch{};
    auto* addr = fromAddress ? static_cast<sockaddr_in*>(fromAddress) : &scratch;
    socklen_t addrLen = sizeof(sockaddr_in);

    const auto received = ::recvfrom(_impl->fd,
                                     buffer.data(),
                                     buffer.size(),
                                     0,
                                     reinterpret_cast<sockaddr*>(addr),
                                     &addrLen);

    if (received < 0)
    {
        if (errno == EWOULDBLOCK || errno == EAGAIN)
        {
            return core::u32{0};
        }
        return core::makeError(core::ErrorCode::kNetworkReceiveFailed,
                               std::format("recvfrom() failed: {}", std::strerror(errno)));
    }

    return static_cast<core::u32>(received);
}

const char* SocketTransport::name() const noexcept
{
    return "SocketTransport";
}

core::u16 SocketTransport::boundPort() const noexcept
{
    return _impl->boundPort;
}

core::usize socketAddressSize() noexcept
{
    return sizeof(sockaddr_in);
}

core::Expected<void> parseSocketAddress(std::string_view text, void* out)
{
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("expected host:port, got '{}'", text));
    }

    const std::string host{text.substr(0, colon)};
    const auto portText = text.substr(colon + 1);

    core::u16 port = 0;
    const auto [end, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (ec != std::errc{} || end != portText.data() + portText.size() || port == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("invalid port in '{}'", text));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("invalid IPv4 address '{}'", host));
    }

    std::memcpy(out, &addr, sizeof(addr));
    return {};
}

} // namespace cinder::net::transport
