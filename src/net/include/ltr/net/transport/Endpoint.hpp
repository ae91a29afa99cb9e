// /////////////////////////////////////////////////////////////////////////////
/// @file Endpoint.hpp
/// @brief "host:port" datagram address.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>

#include <string>
#include <string_view>

namespace ltr::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Endpoint
/// @brief Transport-independent peer address.
// /////////////////////////////////////////////////////////////////////////////
struct Endpoint
{
    std::string host;
    core::u16   port{0};

    /// @brief Parses "host:port". The port must be in [1, 65535].
    [[nodiscard]] static core::Expected<Endpoint> parse(std::string_view text);

    /// @brief Looks the host up as an IPv4 datagram address.
    /// @return kAddressResolutionFailed when the name does not resolve.
    [[nodiscard]] core::Expected<void> checkResolvable() const;

    /// @brief Canonical "host:port" form, as carried on the wire.
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const Endpoint&) const = default;
};

} // namespace ltr::net::transport
