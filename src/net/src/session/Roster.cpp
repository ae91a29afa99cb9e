// /////////////////////////////////////////////////////////////////////////////
/// @file Roster.cpp
/// @brief Roster implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/session/Roster.hpp>

#include <algorithm>
#include <format>

namespace ltr::net::session {

core::Expected<void> Roster::add(Peer peer)
{
    if (contains(peer.id))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               std::format("peer '{}' already registered", peer.id));
    }
    peers_.push_back(std::move(peer));
    return {};
}

bool Roster::remove(std::string_view id)
{
    const auto it = std::find_if(peers_.begin(), peers_.end(),
                                 [id](const Peer& p) { return p.id == id; });
    if (it == peers_.end())
    {
        return false;
    }
    peers_.erase(it);
    return true;
}

std::optional<std::string> Roster::leader() const
{
    if (peers_.empty())
    {
        return std::nullopt;
    }
    return peers_.front().id;
}

bool Roster::isLeader(std::string_view id) const noexcept
{
    return !peers_.empty() && peers_.front().id == id;
}

Peer* Roster::find(std::string_view id) noexcept
{
    const auto it = std::find_if(peers_.begin(), peers_.end(),
                                 [id](const Peer& p) { return p.id == id; });
    return (it != peers_.end()) ? &*it : nullptr;
}

const Peer* Roster::find(std::string_view id) const noexcept
{
    const auto it = std::find_if(peers_.begin(), peers_.end(),
                                 [id](const Peer& p) { return p.id == id; });
    return (it != peers_.end()) ? &*it : nullptr;
}

const Peer* Roster::findByEndpoint(std::string_view endpoint) const noexcept
{
    const auto it = std::find_if(peers_.begin(), peers_.end(),
                                 [endpoint](const Peer& p) { return p.endpoint == endpoint; });
    return (it != peers_.end()) ? &*it : nullptr;
}

bool Roster::contains(std::string_view id) const noexcept
{
    return find(id) != nullptr;
}

void Roster::forEach(const std::function<void(Peer&)>& callback)
{
    for (auto& peer : peers_)
    {
        callback(peer);
    }
}

} // namespace ltr::net::session
