// /////////////////////////////////////////////////////////////////////////////
/// @file HistoryAggregator.hpp
/// @brief Leader-side trail history and its projection onto the board.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/session/History.hpp>
#include <ltr/grid/Board.hpp>
#include <ltr/core/Types.hpp>

#include <string_view>

namespace ltr::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @struct PaintStats
/// @brief Outcome of projecting a history onto a board.
// /////////////////////////////////////////////////////////////////////////////
struct PaintStats
{
    core::u32 written{0};
    core::u32 skippedDead{0};
    core::u32 rejected{0};      ///< Out-of-grid positions or unknown identities.
};

// /////////////////////////////////////////////////////////////////////////////
/// @class HistoryAggregator
/// @brief Owns the cached @ref session::History of the local peer.
///
/// While the local peer leads, @ref append is the only writer. Followers
/// only ever @ref replace their copy with the one carried by a leader
/// broadcast (last-writer-wins, no merge).
///
/// @ref paint overlays every trail onto the board: all positions but the
/// last become trail cells, the last becomes the head. Dead cells are left
/// untouched, so repainting the same history is idempotent.
/// Not thread-safe; the owner serialises access.
// /////////////////////////////////////////////////////////////////////////////
class HistoryAggregator
{
public:
    HistoryAggregator() = default;

    /// @brief Appends @p pos to the trail of @p id, unless it repeats the
    ///        current head. A parked peer never grows its trail.
    void append(std::string_view id, grid::Position pos);

    /// @brief Replaces the whole cached history.
    void replace(session::History history);

    /// @brief Projects the cached history onto @p board.
    PaintStats paint(grid::Board& board, const session::SlotTable& slots) const;

    [[nodiscard]] const session::History& history() const noexcept { return history_; }

    /// @brief Number of positions recorded for @p id.
    [[nodiscard]] core::u32 length(std::string_view id) const;

private:
    session::History history_;
};

} // namespace ltr::net::netcode
