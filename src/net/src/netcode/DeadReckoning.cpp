// /////////////////////////////////////////////////////////////////////////////
/// @file DeadReckoning.cpp
/// @brief DeadReckoning implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/netcode/DeadReckoning.hpp>
#include <ltr/core/Log.hpp>

#include <format>

namespace ltr::net::netcode {

namespace {

bool markUnlessDead(grid::Board& board, grid::Position pos, grid::CellKind kind, core::u8 slot)
{
    if (board.at(pos).kind == grid::CellKind::Dead)
    {
        return false;
    }
    return board.mark(pos, kind, slot);
}

} // anonymous namespace

core::i32 DeadReckoning::stepsAlong(grid::Position from, grid::Direction heading,
                                    grid::Position to) noexcept
{
    switch (heading)
    {
    case grid::Direction::Up:
        return (to.x == from.x && to.y <= from.y) ? from.y - to.y : -1;
    case grid::Direction::Down:
        return (to.x == from.x && to.y >= from.y) ? to.y - from.y : -1;
    case grid::Direction::Left:
        return (to.y == from.y && to.x <= from.x) ? from.x - to.x : -1;
    case grid::Direction::Right:
        return (to.y == from.y && to.x >= from.x) ? to.x - from.x : -1;
    }
    return -1;
}

core::Expected<ReckoningResult> DeadReckoning::reconstruct(grid::Board& board,
                                                           session::Peer& peer,
                                                           grid::Position position,
                                                           grid::Direction heading)
{
    if (!board.inBounds(position))
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               std::format("fix ({}, {}) for '{}' is off the board",
                                           position.x, position.y, peer.id));
    }

    ReckoningResult result;

    if (position == peer.position)
    {
        peer.heading = heading;
        return result;
    }

    const core::i32 steps = stepsAlong(peer.position, peer.heading, position);
    if (steps < 0)
    {
        core::Log::debug("RECKON", std::format("'{}' fix ({}, {}) not on heading {} from ({}, {}), snapping",
                                               peer.id, position.x, position.y, grid::toChar(peer.heading),
                                               peer.position.x, peer.position.y));
        result.snapped = true;
    }
    else
    {
        grid::Position cursor = peer.position;
        for (core::i32 i = 0; i < steps; ++i)
        {
            if (markUnlessDead(board, cursor, grid::CellKind::Trail, peer.slot))
            {
                ++result.trailCells;
            }
            cursor = grid::step(cursor, peer.heading);
        }
    }

    result.headMarked = markUnlessDead(board, position, grid::CellKind::Head, peer.slot);
    peer.position = position;
    peer.heading  = heading;
    return result;
}

} // namespace ltr::net::netcode
