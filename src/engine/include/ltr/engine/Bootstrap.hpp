// /////////////////////////////////////////////////////////////////////////////
/// @file Bootstrap.hpp
/// @brief Turns the matchmaking roster into the initial session state.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ltr/engine/Config.hpp>
#include <ltr/net/session/History.hpp>
#include <ltr/net/session/Roster.hpp>
#include <ltr/core/Expected.hpp>

#include <span>
#include <string>
#include <string_view>

namespace ltr::engine {

/// @brief One {identity, endpoint} pair as delivered by matchmaking.
struct RosterEntry
{
    std::string id;
    std::string endpoint;

    [[nodiscard]] bool operator==(const RosterEntry&) const = default;
};

/// @brief Initial roster, board slots and local identity of a session.
struct SessionSeed
{
    net::session::Roster     roster;
    net::session::SlotTable  slots;
    std::string              selfId;
};

/// @brief Parses @c "id@host:port".
/// @return @c InvalidArgument on a missing separator, an empty identity
///         or a malformed endpoint.
[[nodiscard]] core::Expected<RosterEntry> parseRosterEntry(std::string_view text);

/// @brief Builds the session seed from the ordered @p entries.
///
/// Each peer spawns at the cell and heading configured for its identity
/// and receives the board slot matching its position in @p entries. The
/// local peer is the entry whose endpoint equals the configured self
/// endpoint.
///
/// @return @c BootstrapFailed when the roster is too small or too large,
///         contains duplicates, an identity without spawn, two peers
///         sharing a spawn cell, an unparsable or unresolvable endpoint,
///         or no entry for the local endpoint.
[[nodiscard]] core::Expected<SessionSeed> bootstrap(const Config& config,
                                                    std::span<const RosterEntry> entries);

} // namespace ltr::engine
