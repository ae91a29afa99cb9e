// /////////////////////////////////////////////////////////////////////////////
/// @file SocketTransport.hpp
/// @brief Standard POSIX UDP socket transport.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/transport/ITransport.hpp>
#include <ltr/core/NonCopyable.hpp>

#include <memory>

namespace ltr::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class SocketTransport
/// @brief POSIX UDP socket-based transport (non-blocking).
///
/// Binds to the local endpoint's port on @ref open and uses @c sendto /
/// @c recvfrom for packet exchange; @ref receive waits with @c poll.
/// Destination host names are resolved once (IPv4) and cached.
// /////////////////////////////////////////////////////////////////////////////
class SocketTransport final : public ITransport,
                              public core::NonCopyable<SocketTransport>
{
public:
    /// @brief Constructs a socket transport for the given local endpoint.
    /// @param local Address to listen on; an empty host means any interface.
    explicit SocketTransport(Endpoint local);
    ~SocketTransport() override;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> send(
        std::span<const core::byte> data,
        const Endpoint& destination) override;

    [[nodiscard]] core::Expected<core::u32> receive(
        std::span<core::byte> buffer,
        Endpoint& from,
        core::Millis timeout) override;

    [[nodiscard]] const char* name() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ltr::net::transport
