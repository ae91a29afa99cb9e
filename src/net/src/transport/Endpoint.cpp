// /////////////////////////////////////////////////////////////////////////////
/// @file Endpoint.cpp
/// @brief Endpoint parsing and formatting.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/transport/Endpoint.hpp>

#include <charconv>
#include <format>
#include <string>

#include <netdb.h>
#include <sys/socket.h>

namespace ltr::net::transport {

core::Expected<Endpoint> Endpoint::parse(std::string_view text)
{
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("malformed endpoint '{}'", text));
    }

    const auto portText = text.substr(colon + 1);
    core::u32 port = 0;
    const auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (ec != std::errc{} || ptr != portText.data() + portText.size() || port == 0 || port > 65535)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("invalid port in endpoint '{}'", text));
    }

    return Endpoint{std::string{text.substr(0, colon)}, static_cast<core::u16>(port)};
}

core::Expected<void> Endpoint::checkResolvable() const
{
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* info = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &info);
    if (rc != 0 || info == nullptr)
    {
        return core::makeError(core::ErrorCode::kAddressResolutionFailed,
                               std::format("cannot resolve '{}': {}", toString(), ::gai_strerror(rc)));
    }
    ::freeaddrinfo(info);
    return {};
}

std::string Endpoint::toString() const
{
    return std::format("{}:{}", host, port);
}

} // namespace ltr::net::transport
