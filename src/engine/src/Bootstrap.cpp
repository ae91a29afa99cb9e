// /////////////////////////////////////////////////////////////////////////////
/// @file Bootstrap.cpp
/// @brief Session bootstrap implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/engine/Bootstrap.hpp>
#include <ltr/net/transport/Endpoint.hpp>
#include <ltr/core/Constants.hpp>
#include <ltr/core/Log.hpp>

#include <algorithm>
#include <format>
#include <vector>

namespace ltr::engine {

namespace {

auto failed(std::string message)
{
    return core::makeError(core::ErrorCode::kBootstrapFailed, std::move(message));
}

} // anonymous namespace

core::Expected<RosterEntry> parseRosterEntry(std::string_view text)
{
    const auto at = text.find('@');
    if (at == std::string_view::npos)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("roster entry '{}' is not id@host:port", text));
    }

    const auto id = text.substr(0, at);
    if (id.empty() || id.size() > core::kMaxIdentityLength)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("roster entry '{}' has an invalid identity", text));
    }

    const auto endpoint = text.substr(at + 1);
    LTR_TRY_VOID(net::transport::Endpoint::parse(endpoint));

    return RosterEntry{std::string{id}, std::string{endpoint}};
}

core::Expected<SessionSeed> bootstrap(const Config& config, std::span<const RosterEntry> entries)
{
    const auto count = static_cast<core::u32>(entries.size());
    if (count < core::kMinRoomSize || count > config.roomSize())
    {
        return failed(std::format("roster of {} peers outside [{}, {}]",
                                  count, core::kMinRoomSize, config.roomSize()));
    }

    SessionSeed seed;
    std::vector<grid::Position> taken;

    for (core::u32 i = 0; i < count; ++i)
    {
        const auto& entry = entries[i];

        const auto endpoint = net::transport::Endpoint::parse(entry.endpoint);
        if (!endpoint)
        {
            return failed(std::format("malformed endpoint '{}' of '{}'", entry.endpoint, entry.id));
        }
        if (auto resolved = endpoint->checkResolvable(); !resolved)
        {
            return failed(std::format("peer '{}': {}", entry.id, resolved.error().message()));
        }

        const auto spawn = config.spawnOf(entry.id);
        if (!spawn)
        {
            return failed(std::format("no spawn configured for '{}'", entry.id));
        }
        if (std::find(taken.begin(), taken.end(), spawn->position) != taken.end())
        {
            return failed(std::format("spawn cell ({}, {}) of '{}' already taken",
                                      spawn->position.x, spawn->position.y, entry.id));
        }
        taken.push_back(spawn->position);

        net::session::Peer peer;
        peer.id       = entry.id;
        peer.endpoint = entry.endpoint;
        peer.position = spawn->position;
        peer.heading  = spawn->heading;
        peer.slot     = static_cast<core::u8>(i);

        if (auto added = seed.roster.add(std::move(peer)); !added)
        {
            return failed(added.error().message());
        }
        seed.slots.emplace(entry.id, static_cast<core::u8>(i));

        if (entry.endpoint == config.selfEndpoint())
        {
            seed.selfId = entry.id;
        }
    }

    if (seed.selfId.empty())
    {
        return failed(std::format("self endpoint '{}' is not in the roster", config.selfEndpoint()));
    }

    core::Log::info("BOOT", std::format("session of {} peers, self '{}', leader '{}'",
                                        count, seed.selfId, seed.roster.leader().value_or("")));
    return seed;
}

} // namespace ltr::engine
