// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract datagram transport (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/transport/Endpoint.hpp>
#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>

#include <cstddef>
#include <span>

namespace ltr::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Strategy interface for the unreliable point-to-point channel.
///
/// No ordering and no delivery guarantee: datagrams may be lost or arrive
/// out of send order. @ref send must be callable from several threads at
/// once.
///
/// Concrete implementations:
///   - @c SocketTransport   : POSIX UDP sockets.
///   - @c LoopbackTransport : in-process hub, for tests and local runs.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Opens the transport (bind, register, etc.).
    [[nodiscard]] virtual core::Expected<void> open() = 0;

    /// @brief Closes the transport. Idempotent.
    virtual void close() = 0;

    /// @brief Sends one datagram to @p destination.
    /// @return Number of bytes sent, or error.
    [[nodiscard]] virtual core::Expected<core::u32> send(
        std::span<const core::byte> data,
        const Endpoint& destination) = 0;

    /// @brief Waits up to @p timeout for one datagram.
    /// @param buffer  Destination buffer.
    /// @param[out] from Filled with the sender address.
    /// @return Number of bytes received (0 if nothing arrived), or error.
    [[nodiscard]] virtual core::Expected<core::u32> receive(
        std::span<core::byte> buffer,
        Endpoint& from,
        core::Millis timeout) = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace ltr::net::transport
