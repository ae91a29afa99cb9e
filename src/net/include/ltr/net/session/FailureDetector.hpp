// /////////////////////////////////////////////////////////////////////////////
/// @file FailureDetector.hpp
/// @brief Heartbeat-based failure detection over the roster.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/session/Roster.hpp>
#include <ltr/core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ltr::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @struct SweepResult
/// @brief Outcome of one failure-detection pass.
// /////////////////////////////////////////////////////////////////////////////
struct SweepResult
{
    /// Identities removed from the roster, in roster order.
    std::vector<std::string> evicted;

    /// @c true if the local peer was leader when the pass started; its
    /// evictions must then be published in the dead-node set.
    bool asLeader{false};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class FailureDetector
/// @brief Per-peer last-seen clock with an asymmetric eviction policy.
///
/// A peer is considered lapsed when @c now - lastSeen exceeds the
/// threshold. The leader evicts every lapsed follower; a follower only
/// watches roster index 0 and leaves other followers to the next leader.
/// Not thread-safe; the owner serialises access together with the roster.
// /////////////////////////////////////////////////////////////////////////////
class FailureDetector
{
public:
    /// @param threshold Silence tolerated before eviction.
    explicit FailureDetector(core::Millis threshold);

    /// @brief Starts (or restarts) the clock for @p id at @p now.
    void track(std::string_view id, core::TimePoint now);

    /// @brief Refreshes the clock of a tracked peer.
    /// @return @c false if @p id is not tracked.
    bool touch(std::string_view id, core::TimePoint now);

    /// @brief Stops tracking @p id.
    void forget(std::string_view id);

    /// @brief @c true if @p id is tracked and its silence exceeds the threshold.
    [[nodiscard]] bool hasLapsed(std::string_view id, core::TimePoint now) const;

    /// @brief Last time @p id was heard from, if tracked.
    [[nodiscard]] std::optional<core::TimePoint> lastSeen(std::string_view id) const;

    /// @brief Applies the eviction policy for @p selfId to @p roster.
    ///
    /// Removal and the following leadership read happen within this call,
    /// so the caller observes the post-eviction leader as soon as it
    /// returns.
    SweepResult sweep(Roster& roster, std::string_view selfId, core::TimePoint now);

    [[nodiscard]] core::Millis threshold() const noexcept { return threshold_; }

private:
    core::Millis                                   threshold_;
    std::unordered_map<std::string, core::TimePoint> lastSeen_;
};

} // namespace ltr::net::session
