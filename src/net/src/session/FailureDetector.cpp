// /////////////////////////////////////////////////////////////////////////////
/// @file FailureDetector.cpp
/// @brief FailureDetector implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/session/FailureDetector.hpp>
#include <ltr/core/Log.hpp>

#include <format>

namespace ltr::net::session {

FailureDetector::FailureDetector(core::Millis threshold)
    : threshold_{threshold}
{}

void FailureDetector::track(std::string_view id, core::TimePoint now)
{
    lastSeen_.insert_or_assign(std::string{id}, now);
}

bool FailureDetector::touch(std::string_view id, core::TimePoint now)
{
    const auto it = lastSeen_.find(std::string{id});
    if (it == lastSeen_.end())
    {
        return false;
    }
    // Datagrams handled out of order must not move the clock backwards.
    if (now > it->second)
    {
        it->second = now;
    }
    return true;
}

void FailureDetector::forget(std::string_view id)
{
    lastSeen_.erase(std::string{id});
}

bool FailureDetector::hasLapsed(std::string_view id, core::TimePoint now) const
{
    const auto it = lastSeen_.find(std::string{id});
    if (it == lastSeen_.end())
    {
        return false;
    }
    return (now - it->second) > threshold_;
}

std::optional<core::TimePoint> FailureDetector::lastSeen(std::string_view id) const
{
    const auto it = lastSeen_.find(std::string{id});
    if (it == lastSeen_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

SweepResult FailureDetector::sweep(Roster& roster, std::string_view selfId, core::TimePoint now)
{
    SweepResult result;
    result.asLeader = roster.isLeader(selfId);

    if (result.asLeader)
    {
        for (const auto& peer : roster.peers())
        {
            if (peer.id != selfId && hasLapsed(peer.id, now))
            {
                result.evicted.push_back(peer.id);
            }
        }
    }
    else if (const auto leaderId = roster.leader(); leaderId && hasLapsed(*leaderId, now))
    {
        result.evicted.push_back(*leaderId);
    }

    for (const auto& id : result.evicted)
    {
        roster.remove(id);
        forget(id);
        core::Log::warn("FD", std::format("peer '{}' lapsed (threshold {} ms), evicted{}",
                                          id, threshold_.count(),
                                          result.asLeader ? "" : " as leader"));
    }

    if (!result.asLeader && !result.evicted.empty())
    {
        const auto next = roster.leader();
        core::Log::info("FD", std::format("leader is now '{}'", next.value_or("<none>")));
    }

    return result;
}

} // namespace ltr::net::session
