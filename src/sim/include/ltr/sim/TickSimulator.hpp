// /////////////////////////////////////////////////////////////////////////////
/// @file TickSimulator.hpp
/// @brief Fixed-step movement and collision resolution on the board.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/session/Roster.hpp>
#include <ltr/net/session/Peer.hpp>
#include <ltr/grid/Board.hpp>
#include <ltr/core/Types.hpp>

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ltr::sim {

// /////////////////////////////////////////////////////////////////////////////
/// @enum StepOutcome
/// @brief Result of advancing one peer by one tick.
// /////////////////////////////////////////////////////////////////////////////
enum class StepOutcome : core::u8
{
    Moved,
    Collided,
    Skipped
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct PeerStep
/// @brief Per-peer entry of a @ref TickReport.
// /////////////////////////////////////////////////////////////////////////////
struct PeerStep
{
    std::string     id;
    StepOutcome     outcome{StepOutcome::Skipped};
    grid::Position  position{};     ///< Position after the step.
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct TickReport
/// @brief Everything one tick changed, in roster order.
// /////////////////////////////////////////////////////////////////////////////
struct TickReport
{
    std::vector<PeerStep> steps;

    /// @c true only on the tick where the local peer collided.
    bool selfDied{false};

    [[nodiscard]] core::u32 collisions() const noexcept;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class TickSimulator
/// @brief Advances every live peer of the roster by one cell per tick.
///
/// For each peer, in roster order: its current cell becomes trail, the
/// candidate cell is one step along its heading clamped to the grid, and
/// the peer collides when the candidate is out of range or already marked
/// (own trail included). A peer pinned against a wall therefore collides in
/// place. A collided peer keeps its position, its cell is marked dead and
/// it is skipped by every later tick.
///
/// Peers are resolved one after another: a peer later in the roster sees
/// the cells written by earlier peers in the same tick.
/// Not thread-safe; the owner serialises access.
// /////////////////////////////////////////////////////////////////////////////
class TickSimulator
{
public:
    /// @param selfId Identity of the local peer.
    explicit TickSimulator(std::string selfId);

    /// @brief Runs one tick over @p roster.
    TickReport tick(grid::Board& board, net::session::Roster& roster);

    /// @brief Advances a single peer without any bookkeeping.
    static StepOutcome advance(grid::Board& board, net::session::Peer& peer);

    /// @brief Excludes @p id from future ticks (death reported elsewhere).
    /// @return @c false if it was already excluded.
    bool markDead(std::string_view id);

    [[nodiscard]] bool isDead(std::string_view id) const;
    [[nodiscard]] bool selfAlive() const { return !isDead(selfId_); }
    [[nodiscard]] const std::string& selfId() const noexcept { return selfId_; }
    [[nodiscard]] core::u64 tickCount() const noexcept { return ticks_; }

private:
    std::string                            selfId_;
    std::set<std::string, std::less<>>     dead_;
    core::u64                              ticks_{0};
};

} // namespace ltr::sim
