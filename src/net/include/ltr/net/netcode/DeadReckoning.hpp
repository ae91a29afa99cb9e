// /////////////////////////////////////////////////////////////////////////////
/// @file DeadReckoning.hpp
/// @brief Path reconstruction between two fixes of a remote peer.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/session/Peer.hpp>
#include <ltr/grid/Board.hpp>
#include <ltr/grid/Direction.hpp>
#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>

namespace ltr::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @struct ReckoningResult
/// @brief What a reconstruction drew.
// /////////////////////////////////////////////////////////////////////////////
struct ReckoningResult
{
    core::u32 trailCells{0};
    bool      headMarked{false};

    /// @c true when the new fix was not reachable along the old heading
    /// and the peer was moved there directly.
    bool      snapped{false};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class DeadReckoning
/// @brief Rebuilds the cells a remote peer crossed since its last known fix.
///
/// Starting at the peer's known position, steps along its known heading
/// marking trail cells until the announced position is reached, then marks
/// the announced position as head and adopts the announced heading. A fix
/// at the same position only changes the heading.
///
/// A fix that does not lie on the ray of the old heading (lost updates,
/// local simulation ran ahead) is adopted without drawing a path. Dead
/// cells are never overwritten.
// /////////////////////////////////////////////////////////////////////////////
class DeadReckoning final
{
public:
    DeadReckoning() = delete;

    /// @brief Moves @p peer to (@p position, @p heading) and draws its path.
    /// @return @c OutOfRange (and no change) if @p position is off the board.
    [[nodiscard]] static core::Expected<ReckoningResult> reconstruct(grid::Board& board,
                                                                     session::Peer& peer,
                                                                     grid::Position position,
                                                                     grid::Direction heading);

    /// @brief Number of steps along @p heading from @p from to @p to, or
    ///        @c -1 if @p to is not on that ray.
    [[nodiscard]] static core::i32 stepsAlong(grid::Position from, grid::Direction heading,
                                              grid::Position to) noexcept;
};

} // namespace ltr::net::netcode
