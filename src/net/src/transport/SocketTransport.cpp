// /////////////////////////////////////////////////////////////////////////////
/// @file SocketTransport.cpp
/// @brief POSIX UDP socket transport implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/transport/SocketTransport.hpp>
#include <ltr/core/Log.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <string>
#include <unordered_map>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ltr::net::transport {

struct SocketTransport::Impl
{
    Endpoint         local;
    std::atomic<int> fd{-1};

    std::mutex                                   cacheMutex;
    std::unordered_map<std::string, sockaddr_in> resolved;

    explicit Impl(Endpoint e) : local{std::move(e)} {}

    core::Expected<sockaddr_in> resolve(const Endpoint& endpoint)
    {
        const auto key = endpoint.toString();
        {
            std::lock_guard<std::mutex> lock{cacheMutex};
            if (const auto it = resolved.find(key); it != resolved.end())
            {
                return it->second;
            }
        }

        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;

        addrinfo* info = nullptr;
        const int rc = ::getaddrinfo(endpoint.host.c_str(),
                                     std::to_string(endpoint.port).c_str(),
                                     &hints, &info);
        if (rc != 0 || info == nullptr)
        {
            return core::makeError(core::ErrorCode::kAddressResolutionFailed,
                                   std::format("cannot resolve '{}': {}", key, ::gai_strerror(rc)));
        }

        sockaddr_in addr{};
        std::memcpy(&addr, info->ai_addr, sizeof(sockaddr_in));
        ::freeaddrinfo(info);

        std::lock_guard<std::mutex> lock{cacheMutex};
        resolved.insert_or_assign(key, addr);
        return addr;
    }
};

SocketTransport::SocketTransport(Endpoint local)
    : impl_{std::make_unique<Impl>(std::move(local))}
{}

SocketTransport::~SocketTransport()
{
    close();
}

core::Expected<void> SocketTransport::open()
{
    const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("socket() failed: {}", std::strerror(errno)));
    }

    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        ::close(fd);
        return core::makeError(core::ErrorCode::kIoError, "fcntl(O_NONBLOCK) failed");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(impl_->local.port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        const int err = errno;
        ::close(fd);
        return core::makeError(core::ErrorCode::kNetworkBindFailed,
                               std::format("bind({}) failed: {}",
                                           impl_->local.toString(), std::strerror(err)));
    }

    impl_->fd.store(fd);
    core::Log::info("NET", std::format("SocketTransport: bound to port {}", impl_->local.port));
    return {};
}

void SocketTransport::close()
{
    const int fd = impl_->fd.exchange(-1);
    if (fd >= 0)
    {
        ::close(fd);
    }
}

core::Expected<core::u32> SocketTransport::send(
    std::span<const core::byte> data,
    const Endpoint& destination)
{
    const int fd = impl_->fd.load();
    if (fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket not open");
    }

    auto addr = impl_->resolve(destination);
    if (!addr)
    {
        return std::unexpected(std::move(addr.error()));
    }

    const auto sent = ::sendto(fd,
                               data.data(),
                               data.size(),
                               0,
                               reinterpret_cast<const sockaddr*>(&*addr),
                               sizeof(sockaddr_in));

    if (sent < 0)
    {
        return core::makeError(core::ErrorCode::kNetworkSendFailed,
                               std::format("sendto({}) failed: {}",
                                           destination.toString(), std::strerror(errno)));
    }

    return static_cast<core::u32>(sent);
}

core::Expected<core::u32> SocketTransport::receive(
    std::span<core::byte> buffer,
    Endpoint& from,
    core::Millis timeout)
{
    const int fd = impl_->fd.load();
    if (fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Socket not open");
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0)
    {
        if (errno == EINTR)
        {
            return core::u32{0};
        }
        return core::makeError(core::ErrorCode::kNetworkReceiveFailed,
                               std::format("poll() failed: {}", std::strerror(errno)));
    }
    if (ready == 0)
    {
        return core::u32{0};
    }

    sockaddr_in addr{};
    socklen_t addrLen = sizeof(sockaddr_in);

    const auto received = ::recvfrom(fd,
                                     buffer.data(),
                                     buffer.size(),
                                     0,
                                     reinterpret_cast<sockaddr*>(&addr),
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

    char host[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
    from.host = host;
    from.port = ntohs(addr.sin_port);

    return static_cast<core::u32>(received);
}

const char* SocketTransport::name() const noexcept
{
    return "SocketTransport";
}

} // namespace ltr::net::transport
