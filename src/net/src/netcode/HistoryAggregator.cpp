// /////////////////////////////////////////////////////////////////////////////
/// @file HistoryAggregator.cpp
/// @brief HistoryAggregator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/netcode/HistoryAggregator.hpp>
#include <ltr/core/Log.hpp>

#include <format>

namespace ltr::net::netcode {

void HistoryAggregator::append(std::string_view id, grid::Position pos)
{
    auto it = history_.find(id);
    if (it == history_.end())
    {
        it = history_.emplace(std::string{id}, std::vector<grid::Position>{}).first;
    }
    auto& trail = it->second;
    if (!trail.empty() && trail.back() == pos)
    {
        return;
    }
    trail.push_back(pos);
}

void HistoryAggregator::replace(session::History history)
{
    history_ = std::move(history);
}

PaintStats HistoryAggregator::paint(grid::Board& board, const session::SlotTable& slots) const
{
    PaintStats stats;

    for (const auto& [id, trail] : history_)
    {
        const auto slot = slots.find(id);
        if (slot == slots.end())
        {
            core::Log::warn("HIST", std::format("history entry for unknown peer '{}' ignored", id));
            stats.rejected += static_cast<core::u32>(trail.size());
            continue;
        }

        for (core::usize i = 0; i < trail.size(); ++i)
        {
            const auto pos = trail[i];
            if (!board.inBounds(pos))
            {
                ++stats.rejected;
                continue;
            }
            if (board.at(pos).kind == grid::CellKind::Dead)
            {
                ++stats.skippedDead;
                continue;
            }

            const bool isHead = (i + 1 == trail.size());
            board.mark(pos, isHead ? grid::CellKind::Head : grid::CellKind::Trail, slot->second);
            ++stats.written;
        }
    }

    if (stats.rejected > 0)
    {
        core::Log::warn("HIST", std::format("{} history positions rejected", stats.rejected));
    }
    return stats;
}

core::u32 HistoryAggregator::length(std::string_view id) const
{
    const auto it = history_.find(id);
    return it == history_.end() ? 0u : static_cast<core::u32>(it->second.size());
}

} // namespace ltr::net::netcode
