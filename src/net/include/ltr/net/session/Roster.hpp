// /////////////////////////////////////////////////////////////////////////////
/// @file Roster.hpp
/// @brief Ordered membership table; index 0 is the leader.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/session/Peer.hpp>
#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ltr::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class Roster
/// @brief Peers in registration order, unique by identity.
///
/// Leadership is positional: whoever sits at index 0 leads. Removing a peer
/// shifts every later peer left, which is the only failover mechanism.
/// Leadership is never cached; every query reads index 0 afresh.
/// Not thread-safe; the owner serialises access.
// /////////////////////////////////////////////////////////////////////////////
class Roster
{
public:
    Roster() = default;

    /// @brief Appends @p peer at the end of the roster.
    /// @return @c AlreadyExists if the identity is already registered.
    [[nodiscard]] core::Expected<void> add(Peer peer);

    /// @brief Removes @p id. Removing a non-member is a no-op.
    /// @return @c true if a peer was removed.
    bool remove(std::string_view id);

    /// @brief Identity at index 0, or @c nullopt when empty.
    [[nodiscard]] std::optional<std::string> leader() const;

    /// @brief @c true when @p id currently sits at index 0.
    [[nodiscard]] bool isLeader(std::string_view id) const noexcept;

    [[nodiscard]] Peer* find(std::string_view id) noexcept;
    [[nodiscard]] const Peer* find(std::string_view id) const noexcept;

    /// @brief Finds the peer whose endpoint equals @p endpoint.
    [[nodiscard]] const Peer* findByEndpoint(std::string_view endpoint) const noexcept;

    [[nodiscard]] bool contains(std::string_view id) const noexcept;

    /// @brief Iterates peers in roster order.
    void forEach(const std::function<void(Peer&)>& callback);

    [[nodiscard]] std::span<const Peer> peers() const noexcept { return peers_; }
    [[nodiscard]] core::u32 size() const noexcept { return static_cast<core::u32>(peers_.size()); }
    [[nodiscard]] bool empty() const noexcept { return peers_.empty(); }

private:
    std::vector<Peer> peers_;
};

} // namespace ltr::net::session
