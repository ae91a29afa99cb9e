// /////////////////////////////////////////////////////////////////////////////
/// @file TickSimulator.cpp
/// @brief TickSimulator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/sim/TickSimulator.hpp>
#include <ltr/grid/Direction.hpp>
#include <ltr/core/Log.hpp>

#include <algorithm>
#include <format>

namespace ltr::sim {

core::u32 TickReport::collisions() const noexcept
{
    return static_cast<core::u32>(std::count_if(steps.begin(), steps.end(), [](const PeerStep& s) {
        return s.outcome == StepOutcome::Collided;
    }));
}

TickSimulator::TickSimulator(std::string selfId)
    : selfId_{std::move(selfId)}
{}

TickReport TickSimulator::tick(grid::Board& board, net::session::Roster& roster)
{
    TickReport report;
    report.steps.reserve(roster.size());

    roster.forEach([&](net::session::Peer& peer) {
        PeerStep entry{peer.id, StepOutcome::Skipped, peer.position};

        if (!isDead(peer.id))
        {
            entry.outcome  = advance(board, peer);
            entry.position = peer.position;

            if (entry.outcome == StepOutcome::Collided)
            {
                dead_.insert(peer.id);
                core::Log::info("SIM", std::format("'{}' crashed at ({}, {})",
                                                   peer.id, peer.position.x, peer.position.y));
                if (peer.id == selfId_)
                {
                    report.selfDied = true;
                }
            }
        }

        report.steps.push_back(std::move(entry));
    });

    ++ticks_;
    return report;
}

StepOutcome TickSimulator::advance(grid::Board& board, net::session::Peer& peer)
{
    const grid::Position current = peer.position;
    if (!board.inBounds(current))
    {
        core::Log::error("SIM", std::format("'{}' stored off the board at ({}, {})",
                                            peer.id, current.x, current.y));
        return StepOutcome::Skipped;
    }

    board.mark(current, grid::CellKind::Trail, peer.slot);

    const grid::Position candidate = board.clamp(grid::step(current, peer.heading));
    if (!board.inBounds(candidate) || !board.isEmpty(candidate))
    {
        board.mark(current, grid::CellKind::Dead, peer.slot);
        return StepOutcome::Collided;
    }

    board.mark(candidate, grid::CellKind::Head, peer.slot);
    peer.position = candidate;
    return StepOutcome::Moved;
}

bool TickSimulator::markDead(std::string_view id)
{
    return dead_.emplace(id).second;
}

bool TickSimulator::isDead(std::string_view id) const
{
    return dead_.find(id) != dead_.end();
}

} // namespace ltr::sim
