// /////////////////////////////////////////////////////////////////////////////
/// @file LoggingEventSink.cpp
/// @brief LoggingEventSink implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/engine/IEventSink.hpp>
#include <ltr/core/Log.hpp>

#include <algorithm>
#include <format>

namespace ltr::engine {

void LoggingEventSink::onLocalDeath(std::string_view selfId)
{
    core::Log::info("EVENT", std::format("'{}' is out of the race", selfId));
}

void LoggingEventSink::onBoardUpdated(const grid::Board& board)
{
    const auto cells = board.cells();
    const auto occupied = std::count_if(cells.begin(), cells.end(),
                                        [](const grid::Cell& c) { return !c.empty(); });
    const auto dead = std::count_if(cells.begin(), cells.end(),
                                    [](const grid::Cell& c) { return c.kind == grid::CellKind::Dead; });
    core::Log::debug("EVENT", std::format("board updated: {} occupied, {} dead", occupied, dead));
}

void LoggingEventSink::onVictory(std::string_view selfId)
{
    core::Log::info("EVENT", std::format("victory for '{}'", selfId));
}

} // namespace ltr::engine
