// /////////////////////////////////////////////////////////////////////////////
/// @file IEventSink.hpp
/// @brief Outbound simulation events for the presentation layer.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ltr/grid/Board.hpp>

#include <string_view>

namespace ltr::engine {

// /////////////////////////////////////////////////////////////////////////////
/// @class IEventSink
/// @brief One-way notifications emitted by a @c PeerNode.
///
/// Called from the node's loop threads, never while the node's state lock
/// is held. Implementations must be thread-safe and return quickly.
// /////////////////////////////////////////////////////////////////////////////
class IEventSink
{
public:
    virtual ~IEventSink() = default;

    /// @brief The local peer collided.
    virtual void onLocalDeath(std::string_view selfId) = 0;

    /// @brief The board changed (tick, history replacement, path rebuild).
    virtual void onBoardUpdated(const grid::Board& board) = 0;

    /// @brief The alive tally reached the victory threshold.
    virtual void onVictory(std::string_view selfId) = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class LoggingEventSink
/// @brief Default sink writing every event to the log under the "EVENT" tag.
// /////////////////////////////////////////////////////////////////////////////
class LoggingEventSink final : public IEventSink
{
public:
    void onLocalDeath(std::string_view selfId) override;
    void onBoardUpdated(const grid::Board& board) override;
    void onVictory(std::string_view selfId) override;
};

} // namespace ltr::engine
