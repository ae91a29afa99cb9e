// /////////////////////////////////////////////////////////////////////////////
/// @file PeerNode.hpp
/// @brief Per-peer protocol orchestrator (Façade pattern).
///
/// Wires the roster, failure detector, history aggregator, dead-reckoning
/// predictor and tick simulator to the gossip layer, and drives them from
/// four loops: listen, broadcast, tick and failure check.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ltr/engine/Bootstrap.hpp>
#include <ltr/engine/Config.hpp>
#include <ltr/engine/IEventSink.hpp>
#include <ltr/net/protocol/Envelope.hpp>
#include <ltr/net/session/DeadNodeSet.hpp>
#include <ltr/net/session/FailureDetector.hpp>
#include <ltr/net/session/History.hpp>
#include <ltr/net/session/Peer.hpp>
#include <ltr/net/transport/ITransport.hpp>
#include <ltr/grid/Board.hpp>
#include <ltr/grid/Direction.hpp>
#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ltr::engine {

/// @brief Participation state of the local peer.
enum class Phase : core::u8
{
    AlivePlaying,
    DeadReported,
    GameOver
};

[[nodiscard]] std::string_view toString(Phase phase) noexcept;

/// @brief Protocol orchestrator of one local peer.
///
/// All shared state (roster, last-seen clocks, history, dead-node set,
/// board, simulator) sits behind a single mutex. Every public operation
/// takes it once; role checks read roster index 0 under that same lock,
/// so an eviction and the following leader read are never torn. Events
/// and outbound envelopes are produced under the lock but delivered after
/// it is released.
///
/// The @c *Once operations run one iteration of the corresponding loop
/// with an explicit time and are what @ref start schedules; tests drive
/// them directly.
class PeerNode
{
public:
    /// @param config    Validated configuration.
    /// @param seed      Bootstrapped roster; the local peer must be in it.
    /// @param transport Opened transport; must outlive the node.
    /// @param sink      Event receiver; must outlive the node.
    PeerNode(Config config, SessionSeed seed, net::transport::ITransport& transport, IEventSink& sink);
    ~PeerNode();

    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    // --------------------------------------------------------------------- //
    //  Loops                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Starts the listen, broadcast, tick and failure-check loops.
    /// @return @c InvalidState if already started.
    [[nodiscard]] core::Expected<void> start();

    /// @brief Stops every loop and drains in-flight sends. Idempotent.
    void stop();

    // --------------------------------------------------------------------- //
    //  Single steps                                                          //
    // --------------------------------------------------------------------- //

    /// @brief Applies one received envelope.
    /// @return @c false if the envelope was ignored.
    bool handleEnvelope(const net::protocol::Envelope& envelope, core::TimePoint now);

    /// @brief Waits up to @p timeout for one datagram and applies it.
    /// @return @c true if an envelope was applied.
    bool pumpInbound(core::Millis timeout);

    /// @brief Advances the simulation by one tick.
    void tickOnce();

    /// @brief Sends the periodic update (leader state when leading).
    void broadcastOnce();

    /// @brief Runs one failure-detection pass.
    /// @return Identities evicted by this pass.
    std::vector<std::string> checkFailuresOnce(core::TimePoint now);

    /// @brief Steers the local peer and announces the change.
    /// @return @c false if unchanged, or if the local peer no longer plays.
    bool changeDirection(grid::Direction heading);

    // --------------------------------------------------------------------- //
    //  Observers (each takes the state lock)                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] const std::string& selfId() const noexcept;
    [[nodiscard]] const Config& config() const noexcept;

    [[nodiscard]] Phase phase() const;
    [[nodiscard]] core::u32 aliveCount() const;
    [[nodiscard]] bool isLeader() const;
    [[nodiscard]] std::optional<std::string> leader() const;
    [[nodiscard]] std::vector<std::string> rosterIds() const;
    [[nodiscard]] std::optional<net::session::Peer> peer(std::string_view id) const;
    [[nodiscard]] grid::Board board() const;
    [[nodiscard]] net::session::History history() const;
    [[nodiscard]] net::session::DeadNodeSet deadNodes() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ltr::engine
