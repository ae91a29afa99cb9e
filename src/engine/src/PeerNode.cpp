// /////////////////////////////////////////////////////////////////////////////
/// @file PeerNode.cpp
/// @brief PeerNode orchestrator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/engine/PeerNode.hpp>
#include <ltr/engine/PeriodicLoop.hpp>
#include <ltr/net/Gossip.hpp>
#include <ltr/net/netcode/DeadReckoning.hpp>
#include <ltr/net/netcode/HistoryAggregator.hpp>
#include <ltr/net/transport/Endpoint.hpp>
#include <ltr/sim/TickSimulator.hpp>
#include <ltr/concurrency/ThreadPool.hpp>
#include <ltr/core/Constants.hpp>
#include <ltr/core/Log.hpp>

#include <atomic>
#include <format>
#include <mutex>
#include <set>
#include <thread>

namespace ltr::engine {

std::string_view toString(Phase phase) noexcept
{
    switch (phase)
    {
    case Phase::AlivePlaying: return "AlivePlaying";
    case Phase::DeadReported: return "DeadReported";
    case Phase::GameOver:     return "GameOver";
    }
    return "Unknown";
}

namespace {

/// Work produced under the state lock and delivered once it is released.
struct PendingEvents
{
    bool                                     localDeath{false};
    bool                                     victory{false};
    std::optional<grid::Board>               board;
    std::optional<net::protocol::Envelope>   outbound;
    std::vector<net::transport::Endpoint>    destinations;
};

/// Everything the four loops share.
struct SharedState
{
    net::session::Roster                 roster;
    net::session::SlotTable              slots;
    net::session::FailureDetector        detector;
    net::netcode::HistoryAggregator      history;
    net::session::DeadNodeSet            deadNodes;
    grid::Board                          board;
    sim::TickSimulator                   simulator;
    Phase                                phase{Phase::AlivePlaying};
    core::u32                            aliveCount{0};
    std::set<std::string, std::less<>>   reportedDeaths;

    SharedState(const Config& config, SessionSeed seed)
        : roster{std::move(seed.roster)}
        , slots{std::move(seed.slots)}
        , detector{config.failureThreshold()}
        , board{config.gridDimension()}
        , simulator{seed.selfId}
        , aliveCount{roster.size()}
    {
        const auto now = core::Clock::now();
        for (const auto& peer : roster.peers())
        {
            detector.track(peer.id, now);
            board.mark(peer.position, grid::CellKind::Head, peer.slot);
        }
    }
};

} // anonymous namespace

// /////////////////////////////////////////////////////////////////////////////
//  Impl                                                                      //
// /////////////////////////////////////////////////////////////////////////////

struct PeerNode::Impl
{
    Config                                     config;
    std::string                                selfId;
    IEventSink&                                sink;
    std::unique_ptr<concurrency::ThreadPool>   senders;
    net::Gossip                                gossip;

    mutable std::mutex                         mutex;
    SharedState                                state;

    PeriodicLoop                               tickLoop;
    PeriodicLoop                               broadcastLoop;
    PeriodicLoop                               failureLoop;
    std::thread                                listener;
    std::atomic<bool>                          listening{false};
    bool                                       started{false};

    Impl(Config cfg, SessionSeed seed, net::transport::ITransport& transport, IEventSink& eventSink)
        : config{std::move(cfg)}
        , selfId{seed.selfId}
        , sink{eventSink}
        , senders{config.senderThreads() > 0
                      ? std::make_unique<concurrency::ThreadPool>(config.senderThreads(), "SEND")
                      : nullptr}
        , gossip{transport, senders.get()}
        , state{config, std::move(seed)}
        , tickLoop{"TICK", config.tickInterval()}
        , broadcastLoop{"BCAST", config.broadcastInterval()}
        , failureLoop{"FDLOOP", config.broadcastInterval()}
    {}

    // --------------------------------------------------------------------- //
    //  Helpers; "Locked" ones require the caller to hold the mutex          //
    // --------------------------------------------------------------------- //

    [[nodiscard]] bool isLeaderLocked() const noexcept
    {
        return state.roster.isLeader(selfId);
    }

    [[nodiscard]] std::optional<net::session::Peer> selfSnapshotLocked() const
    {
        const auto* self = state.roster.find(selfId);
        if (self == nullptr)
        {
            core::Log::error("NODE", std::format("'{}' missing from its own roster", selfId));
            return std::nullopt;
        }
        return *self;
    }

    [[nodiscard]] std::vector<net::transport::Endpoint> destinationsLocked() const
    {
        std::vector<net::transport::Endpoint> out;
        out.reserve(state.roster.size());
        for (const auto& peer : state.roster.peers())
        {
            if (peer.id == selfId)
            {
                continue;
            }
            auto endpoint = net::transport::Endpoint::parse(peer.endpoint);
            if (!endpoint)
            {
                core::Log::warn("NODE", std::format("skipping '{}': {}", peer.id, endpoint.error().message()));
                continue;
            }
            out.push_back(std::move(*endpoint));
        }
        return out;
    }

    void queueOutboundLocked(net::protocol::Envelope envelope, PendingEvents& ev) const
    {
        ev.outbound = std::move(envelope);
        ev.destinations = destinationsLocked();
    }

    void checkVictoryLocked(PendingEvents& ev)
    {
        if (state.phase != Phase::GameOver && state.aliveCount <= core::kAliveVictoryThreshold)
        {
            state.phase = Phase::GameOver;
            ev.victory = true;
        }
    }

    void recordDeathLocked(std::string_view id, PendingEvents& ev)
    {
        if (!state.reportedDeaths.emplace(id).second)
        {
            core::Log::debug("NODE", std::format("duplicate death report for '{}'", id));
            return;
        }
        if (state.aliveCount > 0)
        {
            --state.aliveCount;
        }
        core::Log::info("NODE", std::format("death of '{}', {} peers alive", id, state.aliveCount));
        checkVictoryLocked(ev);
    }

    void applyLeaderStateLocked(const net::protocol::Envelope& envelope, PendingEvents& ev)
    {
        for (const auto& id : envelope.deadNodes.ids())
        {
            if (id == selfId)
            {
                core::Log::warn("NODE", std::format("leader '{}' lists us as failed", envelope.sender.id));
                continue;
            }
            state.deadNodes.insert(id);
            if (state.roster.remove(id))
            {
                state.detector.forget(id);
                core::Log::info("NODE", std::format("'{}' dropped on leader '{}' notice", id, envelope.sender.id));
            }
        }

        state.history.replace(envelope.history);
        state.history.paint(state.board, state.slots);
        ev.board = state.board;
    }

    void deliver(PendingEvents&& ev)
    {
        if (ev.outbound)
        {
            auto sent = gossip.fanOut(*ev.outbound, ev.destinations);
            if (!sent && ev.outbound->isLeader)
            {
                core::Log::warn("NODE", std::format("leader state not sendable ({}), falling back to a heartbeat",
                                                    sent.error().message()));
                net::protocol::Envelope heartbeat;
                heartbeat.sender = ev.outbound->sender;
                heartbeat.isDirectionChange = ev.outbound->isDirectionChange;
                heartbeat.isDeathReport = ev.outbound->isDeathReport;
                sent = gossip.fanOut(heartbeat, ev.destinations);
            }
            if (!sent)
            {
                core::Log::error("NODE", std::format("outbound envelope dropped: {}", sent.error().message()));
            }
        }
        if (ev.localDeath)
        {
            sink.onLocalDeath(selfId);
        }
        if (ev.board)
        {
            sink.onBoardUpdated(*ev.board);
        }
        if (ev.victory)
        {
            core::Log::info("NODE", "game over, stopping tick and broadcast");
            tickLoop.requestStop();
            broadcastLoop.requestStop();
            sink.onVictory(selfId);
        }
    }
};

// /////////////////////////////////////////////////////////////////////////////
//  PeerNode                                                                  //
// /////////////////////////////////////////////////////////////////////////////

PeerNode::PeerNode(Config config, SessionSeed seed, net::transport::ITransport& transport, IEventSink& sink)
    : impl_{std::make_unique<Impl>(std::move(config), std::move(seed), transport, sink)}
{
    core::Log::info("NODE", std::format("'{}' ready, leader '{}'",
                                        impl_->selfId, leader().value_or("<none>")));
}

PeerNode::~PeerNode()
{
    stop();
}

core::Expected<void> PeerNode::start()
{
    if (impl_->started)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "peer node already started");
    }
    impl_->started = true;

    impl_->listening = true;
    impl_->listener = std::thread([this] {
        while (impl_->listening)
        {
            pumpInbound(impl_->config.receivePoll());
        }
    });

    auto started = impl_->tickLoop.start([this](core::TimePoint) { tickOnce(); })
        .and_then([this] { return impl_->broadcastLoop.start([this](core::TimePoint) { broadcastOnce(); }); })
        .and_then([this] {
            return impl_->failureLoop.start([this](core::TimePoint now) { checkFailuresOnce(now); });
        });

    if (!started)
    {
        core::Log::error("NODE", std::format("cannot start loops: {}", started.error().message()));
        stop();
        return started;
    }

    core::Log::info("NODE", std::format("'{}' playing", impl_->selfId));
    return {};
}

void PeerNode::stop()
{
    impl_->listening = false;
    if (impl_->listener.joinable())
    {
        impl_->listener.join();
    }

    impl_->tickLoop.stop();
    impl_->broadcastLoop.stop();
    impl_->failureLoop.stop();

    if (impl_->senders)
    {
        impl_->senders->shutdown();
    }
}

bool PeerNode::handleEnvelope(const net::protocol::Envelope& envelope, core::TimePoint now)
{
    PendingEvents ev;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex};
        auto& state = impl_->state;
        const auto& sender = envelope.sender;

        if (sender.id == impl_->selfId)
        {
            core::Log::debug("NODE", "ignoring own envelope");
            return false;
        }
        if (!state.roster.contains(sender.id))
        {
            core::Log::warn("NODE", std::format("envelope from '{}' outside the roster ignored", sender.id));
            return false;
        }
        if (!state.board.inBounds(sender.position))
        {
            core::Log::warn("NODE", std::format("envelope from '{}' places it off the board at ({}, {})",
                                                sender.id, sender.position.x, sender.position.y));
            return false;
        }

        state.detector.touch(sender.id, now);

        if (envelope.isLeader)
        {
            impl_->applyLeaderStateLocked(envelope, ev);
        }
        else if (impl_->isLeaderLocked())
        {
            state.history.append(sender.id, sender.position);
        }

        if (envelope.isDeathReport)
        {
            state.simulator.markDead(sender.id);
            impl_->recordDeathLocked(sender.id, ev);
        }

        if (envelope.isDirectionChange)
        {
            if (auto* peer = state.roster.find(sender.id); peer != nullptr)
            {
                const auto rebuilt = net::netcode::DeadReckoning::reconstruct(
                    state.board, *peer, sender.position, sender.heading);
                if (rebuilt)
                {
                    ev.board = state.board;
                }
                else
                {
                    core::Log::warn("NODE", rebuilt.error().message());
                }
            }
        }
    }

    impl_->deliver(std::move(ev));
    return true;
}

bool PeerNode::pumpInbound(core::Millis timeout)
{
    auto inbound = impl_->gossip.receive(timeout);
    if (!inbound)
    {
        return false;
    }
    return handleEnvelope(inbound->envelope, core::Clock::now());
}

void PeerNode::tickOnce()
{
    PendingEvents ev;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex};
        auto& state = impl_->state;
        if (state.phase == Phase::GameOver)
        {
            return;
        }

        const auto report = state.simulator.tick(state.board, state.roster);

        if (report.selfDied && state.phase == Phase::AlivePlaying)
        {
            state.phase = Phase::DeadReported;
            ev.localDeath = true;

            if (auto self = impl_->selfSnapshotLocked())
            {
                net::protocol::Envelope death;
                death.isDeathReport = true;
                death.sender = std::move(*self);
                impl_->queueOutboundLocked(std::move(death), ev);
            }
        }

        ev.board = state.board;
    }

    impl_->deliver(std::move(ev));
}

void PeerNode::broadcastOnce()
{
    PendingEvents ev;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex};
        auto& state = impl_->state;
        if (state.phase == Phase::GameOver)
        {
            return;
        }

        auto self = impl_->selfSnapshotLocked();
        if (!self)
        {
            return;
        }

        net::protocol::Envelope update;
        if (impl_->isLeaderLocked())
        {
            state.history.append(self->id, self->position);
            update.isLeader  = true;
            update.deadNodes = state.deadNodes;
            update.history   = state.history.history();
        }
        update.sender = std::move(*self);
        impl_->queueOutboundLocked(std::move(update), ev);
    }

    impl_->deliver(std::move(ev));
}

std::vector<std::string> PeerNode::checkFailuresOnce(core::TimePoint now)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    auto& state = impl_->state;

    const auto before = state.roster.leader();
    auto result = state.detector.sweep(state.roster, impl_->selfId, now);

    if (result.asLeader)
    {
        for (const auto& id : result.evicted)
        {
            state.deadNodes.insert(id);
        }
    }

    if (state.roster.leader() != before && impl_->isLeaderLocked())
    {
        core::Log::info("NODE", std::format("'{}' takes over leadership", impl_->selfId));
    }

    return std::move(result.evicted);
}

bool PeerNode::changeDirection(grid::Direction heading)
{
    PendingEvents ev;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex};
        auto& state = impl_->state;
        if (state.phase != Phase::AlivePlaying)
        {
            return false;
        }

        auto* self = state.roster.find(impl_->selfId);
        if (self == nullptr || self->heading == heading)
        {
            return false;
        }

        core::Log::info("NODE", std::format("'{}' turns {} -> {}", self->id,
                                            grid::toChar(self->heading), grid::toChar(heading)));
        self->heading = heading;

        if (impl_->isLeaderLocked())
        {
            state.history.append(self->id, self->position);
        }

        net::protocol::Envelope change;
        change.isDirectionChange = true;
        change.sender = *self;
        impl_->queueOutboundLocked(std::move(change), ev);
    }

    impl_->deliver(std::move(ev));
    return true;
}

// -------------------------------------------------------------------------- //
//  Observers                                                                 //
// -------------------------------------------------------------------------- //

const std::string& PeerNode::selfId() const noexcept { return impl_->selfId; }
const Config& PeerNode::config() const noexcept { return impl_->config; }

Phase PeerNode::phase() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->state.phase;
}

core::u32 PeerNode::aliveCount() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->state.aliveCount;
}

bool PeerNode::isLeader() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->isLeaderLocked();
}

std::optional<std::string> PeerNode::leader() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->state.roster.leader();
}

std::vector<std::string> PeerNode::rosterIds() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    std::vector<std::string> ids;
    for (const auto& peer : impl_->state.roster.peers())
    {
        ids.push_back(peer.id);
    }
    return ids;
}

std::optional<net::session::Peer> PeerNode::peer(std::string_view id) const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    const auto* found = impl_->state.roster.find(id);
    if (found == nullptr)
    {
        return std::nullopt;
    }
    return *found;
}

grid::Board PeerNode::board() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->state.board;
}

net::session::History PeerNode::history() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->state.history.history();
}

net::session::DeadNodeSet PeerNode::deadNodes() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->state.deadNodes;
}

} // namespace ltr::engine
