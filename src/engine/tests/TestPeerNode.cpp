/**
 * @file TestPeerNode.cpp
 * @brief Integration tests for engine::PeerNode over the loopback transport.
 */

#include <catch2/catch.hpp>

#include "ltr/engine/PeerNode.hpp"
#include "ltr/net/transport/LoopbackTransport.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ltr::engine {

using namespace std::chrono_literals;
using grid::CellKind;
using grid::Direction;
using grid::Position;
using net::protocol::Envelope;
using net::transport::LoopbackHub;
using net::transport::LoopbackTransport;

namespace {

class RecordingSink final : public IEventSink
{
public:
    void onLocalDeath(std::string_view) override { ++deaths; }
    void onVictory(std::string_view) override { ++victories; }

    void onBoardUpdated(const grid::Board& board) override
    {
        std::lock_guard<std::mutex> lock{mutex};
        lastBoard = board;
        ++boards;
    }

    std::atomic<int> deaths{0};
    std::atomic<int> victories{0};
    std::atomic<int> boards{0};

    std::mutex mutex;
    std::optional<grid::Board> lastBoard;
};

const std::vector<RosterEntry> kEntries{
    {"p1", "127.0.0.1:7001"},
    {"p2", "127.0.0.1:7002"},
    {"p3", "127.0.0.1:7003"},
};

/// Three peers wired through one hub, sends dispatched inline.
struct Cluster
{
    explicit Cluster(Config::Builder base = Config::Builder{})
    {
        for (std::size_t i = 0; i < kEntries.size(); ++i)
        {
            auto config = Config::Builder{base}.selfEndpoint(kEntries[i].endpoint).senderThreads(0).build();
            REQUIRE(config.has_value());

            auto seed = bootstrap(*config, kEntries);
            REQUIRE(seed.has_value());

            auto endpoint = net::transport::Endpoint::parse(kEntries[i].endpoint);
            transports[i] = std::make_unique<LoopbackTransport>(hub, *endpoint);
            REQUIRE(transports[i]->open());

            nodes[i] = std::make_unique<PeerNode>(std::move(*config), std::move(*seed), *transports[i], sinks[i]);
        }
    }

    PeerNode& node(std::size_t i) { return *nodes[i]; }

    std::shared_ptr<LoopbackHub> hub = std::make_shared<LoopbackHub>();
    std::array<std::unique_ptr<LoopbackTransport>, 3> transports;
    std::array<RecordingSink, 3> sinks;
    std::array<std::unique_ptr<PeerNode>, 3> nodes;
};

Envelope from(std::string id, std::string endpoint, Position position, Direction heading)
{
    Envelope env;
    env.sender = {std::move(id), std::move(endpoint), position, heading, 0};
    return env;
}

Envelope deathOf(std::string id, std::string endpoint, Position position)
{
    auto env = from(std::move(id), std::move(endpoint), position, Direction::Left);
    env.isDeathReport = true;
    return env;
}

} // namespace

TEST_CASE("A bootstrapped node starts from the spawn table", "[engine][node]")
{
    Cluster cluster;
    auto& p2 = cluster.node(1);

    REQUIRE(p2.selfId() == "p2");
    REQUIRE(p2.phase() == Phase::AlivePlaying);
    REQUIRE(p2.aliveCount() == 3);
    REQUIRE(p2.leader() == "p1");
    REQUIRE_FALSE(p2.isLeader());
    REQUIRE(cluster.node(0).isLeader());

    const auto board = p2.board();
    REQUIRE(board.at({1, 1}) == grid::Cell{CellKind::Head, 0});
    REQUIRE(board.at({8, 8}) == grid::Cell{CellKind::Head, 1});
    REQUIRE(board.at({8, 1}) == grid::Cell{CellKind::Head, 2});
}

TEST_CASE("Ticks move every local replica and notify the sink", "[engine][node]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);

    p1.tickOnce();

    REQUIRE(p1.peer("p1")->position == Position{2, 1});
    REQUIRE(p1.peer("p2")->position == Position{7, 8});
    REQUIRE(p1.peer("p3")->position == Position{7, 1});
    REQUIRE(cluster.sinks[0].boards == 1);
    REQUIRE(cluster.sinks[0].lastBoard->at({2, 1}).kind == CellKind::Head);
}

TEST_CASE("The leader records follower updates", "[engine][node][history]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);
    auto& p2 = cluster.node(1);

    p2.broadcastOnce();
    REQUIRE(p1.pumpInbound(50ms));

    const auto history = p1.history();
    REQUIRE(history.at("p2") == std::vector<Position>{{8, 8}});

    SECTION("followers do not aggregate")
    {
        cluster.node(2).broadcastOnce();
        REQUIRE(p2.pumpInbound(50ms));
        REQUIRE(p2.history().empty());
    }
}

TEST_CASE("Followers adopt the leader's history", "[engine][node][history]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);
    auto& p2 = cluster.node(1);

    p1.tickOnce();
    p1.broadcastOnce();
    REQUIRE(p2.pumpInbound(50ms));

    const auto adopted = p2.history();
    REQUIRE(adopted == p1.history());
    REQUIRE(adopted.at("p1") == std::vector<Position>{{2, 1}});
    REQUIRE(p2.board().at({2, 1}) == grid::Cell{CellKind::Head, 0});
    REQUIRE(cluster.sinks[1].boards == 1);
}

TEST_CASE("Applying the same leader update twice leaves the board unchanged", "[engine][node][history]")
{
    Cluster cluster;
    auto& p2 = cluster.node(1);

    auto update = from("p1", "127.0.0.1:7001", {3, 1}, Direction::Right);
    update.isLeader = true;
    update.history["p1"] = {{1, 1}, {2, 1}, {3, 1}};
    update.history["p3"] = {{8, 1}, {7, 1}, {7, 1}};

    const auto now = core::Clock::now();
    REQUIRE(p2.handleEnvelope(update, now));
    const auto once = p2.board();
    REQUIRE(p2.handleEnvelope(update, now + 10ms));

    REQUIRE(p2.board() == once);
    REQUIRE(once.at({2, 1}) == grid::Cell{CellKind::Trail, 0});
    REQUIRE(once.at({3, 1}) == grid::Cell{CellKind::Head, 0});
}

TEST_CASE("Followers drop the peers the leader declares failed", "[engine][node]")
{
    Cluster cluster;
    auto& p2 = cluster.node(1);

    auto update = from("p1", "127.0.0.1:7001", {1, 1}, Direction::Right);
    update.isLeader = true;
    update.deadNodes.insert("p3");
    update.deadNodes.insert("p2");

    REQUIRE(p2.handleEnvelope(update, core::Clock::now()));

    REQUIRE(p2.rosterIds() == std::vector<std::string>{"p1", "p2"});
    REQUIRE(p2.deadNodes().contains("p3"));
    REQUIRE_FALSE(p2.deadNodes().contains("p2"));
    REQUIRE(p2.aliveCount() == 3);
}

TEST_CASE("Envelopes from strangers or off the board are ignored", "[engine][node]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);
    const auto before = p1.board();

    REQUIRE_FALSE(p1.handleEnvelope(deathOf("p9", "127.0.0.1:7009", {4, 4}), core::Clock::now()));
    REQUIRE_FALSE(p1.handleEnvelope(deathOf("p1", "127.0.0.1:7001", {1, 1}), core::Clock::now()));
    REQUIRE_FALSE(p1.handleEnvelope(from("p2", "127.0.0.1:7002", {40, 8}, Direction::Left), core::Clock::now()));

    REQUIRE(p1.aliveCount() == 3);
    REQUIRE(p1.board() == before);
    REQUIRE(p1.history().empty());
}

TEST_CASE("Direction changes rebuild the sender's path", "[engine][node][reckoning]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);
    auto& p2 = cluster.node(1);

    p1.tickOnce();
    p1.tickOnce();
    REQUIRE_FALSE(p1.changeDirection(Direction::Right));
    REQUIRE(p1.changeDirection(Direction::Down));
    REQUIRE(p1.history().at("p1") == std::vector<Position>{{3, 1}});

    REQUIRE(p2.pumpInbound(50ms));

    const auto seen = p2.peer("p1");
    REQUIRE(seen->position == Position{3, 1});
    REQUIRE(seen->heading == Direction::Down);

    const auto board = p2.board();
    REQUIRE(board.at({1, 1}) == grid::Cell{CellKind::Trail, 0});
    REQUIRE(board.at({2, 1}) == grid::Cell{CellKind::Trail, 0});
    REQUIRE(board.at({3, 1}) == grid::Cell{CellKind::Head, 0});
}

TEST_CASE("Death reports lower the alive tally until one remains", "[engine][node][victory]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);
    auto& sink = cluster.sinks[0];

    REQUIRE(p1.handleEnvelope(deathOf("p3", "127.0.0.1:7003", {2, 1}), core::Clock::now()));
    REQUIRE(p1.aliveCount() == 2);
    REQUIRE(p1.phase() == Phase::AlivePlaying);
    REQUIRE(sink.victories == 0);

    REQUIRE(p1.handleEnvelope(deathOf("p3", "127.0.0.1:7003", {2, 1}), core::Clock::now()));
    REQUIRE(p1.aliveCount() == 2);

    REQUIRE(p1.handleEnvelope(deathOf("p2", "127.0.0.1:7002", {5, 8}), core::Clock::now()));
    REQUIRE(p1.aliveCount() == 1);
    REQUIRE(p1.phase() == Phase::GameOver);
    REQUIRE(sink.victories == 1);

    SECTION("a finished game no longer ticks or broadcasts")
    {
        const auto board = p1.board();
        const auto delivered = cluster.hub->deliveredCount();

        p1.tickOnce();
        p1.broadcastOnce();

        REQUIRE(p1.board() == board);
        REQUIRE(cluster.hub->deliveredCount() == delivered);
        REQUIRE_FALSE(p1.changeDirection(Direction::Up));
    }
}

TEST_CASE("A local collision is announced to every peer", "[engine][node][victory]")
{
    Cluster cluster{Config::Builder{}.spawn("p1", {9, 1}, Direction::Right)};
    auto& p1 = cluster.node(0);

    p1.tickOnce();

    REQUIRE(p1.phase() == Phase::DeadReported);
    REQUIRE(cluster.sinks[0].deaths == 1);
    REQUIRE(p1.board().at({9, 1}) == grid::Cell{CellKind::Dead, 0});
    REQUIRE_FALSE(p1.changeDirection(Direction::Down));

    p1.tickOnce();
    REQUIRE(cluster.sinks[0].deaths == 1);

    for (std::size_t i = 1; i < 3; ++i)
    {
        REQUIRE(cluster.node(i).pumpInbound(50ms));
        REQUIRE(cluster.node(i).aliveCount() == 2);
        REQUIRE(cluster.node(i).phase() == Phase::AlivePlaying);
    }
}

TEST_CASE("A silent leader is replaced without an election", "[engine][node][failover]")
{
    Cluster cluster;
    auto& p2 = cluster.node(1);
    auto& p3 = cluster.node(2);

    const auto start = core::Clock::now();
    const auto threshold = p2.config().failureThreshold();

    // p2 and p3 keep hearing each other while p1 stays silent.
    REQUIRE(p2.handleEnvelope(from("p3", "127.0.0.1:7003", {8, 1}, Direction::Left), start + threshold));
    REQUIRE(p3.handleEnvelope(from("p2", "127.0.0.1:7002", {8, 8}, Direction::Left), start + threshold));

    const auto late = start + threshold + 1ms;
    REQUIRE(p2.checkFailuresOnce(late) == std::vector<std::string>{"p1"});
    REQUIRE(p3.checkFailuresOnce(late) == std::vector<std::string>{"p1"});

    REQUIRE(p2.isLeader());
    REQUIRE(p3.leader() == "p2");
    REQUIRE(p2.rosterIds() == std::vector<std::string>{"p2", "p3"});
    REQUIRE(p3.rosterIds() == std::vector<std::string>{"p2", "p3"});
    REQUIRE(p2.aliveCount() == 3);

    SECTION("the new leader now aggregates history")
    {
        p3.broadcastOnce();
        REQUIRE(p2.pumpInbound(50ms));
        REQUIRE(p2.history().at("p3") == std::vector<Position>{{8, 1}});
    }

    SECTION("the new leader evicts lapsed followers and reports them")
    {
        const auto evicted = p2.checkFailuresOnce(start + 3 * threshold);
        REQUIRE(evicted == std::vector<std::string>{"p3"});
        REQUIRE(p2.deadNodes().contains("p3"));
        REQUIRE(p2.rosterIds() == std::vector<std::string>{"p2"});
    }
}

TEST_CASE("Leader broadcasts carry the aggregated state", "[engine][node]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);
    auto& p3 = cluster.node(2);

    cluster.node(1).broadcastOnce();
    REQUIRE(p1.pumpInbound(50ms));

    p1.broadcastOnce();
    REQUIRE(p3.pumpInbound(50ms));
    REQUIRE(p3.pumpInbound(50ms));

    const auto history = p3.history();
    REQUIRE(history.at("p1") == std::vector<Position>{{1, 1}});
    REQUIRE(history.at("p2") == std::vector<Position>{{8, 8}});
}

TEST_CASE("A parked leader keeps reaching its followers", "[engine][node][history]")
{
    Cluster cluster;
    auto& p1 = cluster.node(0);
    auto& p2 = cluster.node(1);
    auto& p3 = cluster.node(2);

    constexpr int kCycles = 5000;
    int received = 0;
    for (int i = 0; i < kCycles; ++i)
    {
        p1.broadcastOnce();
        if (p2.pumpInbound(50ms))
            ++received;
        REQUIRE(p3.pumpInbound(50ms));
    }

    REQUIRE(received == kCycles);
    REQUIRE(p1.history().at("p1") == std::vector<Position>{{1, 1}});
    REQUIRE(p2.history() == p1.history());
    REQUIRE(p2.leader() == "p1");
}

TEST_CASE("An oversized leader update still goes out as a heartbeat", "[engine][node][history]")
{
    Cluster cluster{Config::Builder{}.gridDimension(255)};
    auto& p1 = cluster.node(0);
    auto& p2 = cluster.node(1);

    // 255 x 80 distinct cells at 4 bytes each overflow one datagram.
    const auto start = core::Clock::now();
    for (core::i32 y = 0; y < 80; ++y)
    {
        for (core::i32 x = 0; x < 255; ++x)
        {
            REQUIRE(p1.handleEnvelope(from("p2", "127.0.0.1:7002", {x, y}, Direction::Right), start));
        }
    }
    REQUIRE(p1.history().at("p2").size() == 255u * 80u);

    p1.broadcastOnce();
    REQUIRE(p2.pumpInbound(50ms));

    REQUIRE(p2.history().empty());
    REQUIRE(p2.leader() == "p1");
}

TEST_CASE("Started nodes exchange state on their own", "[engine][node][loops]")
{
    Cluster cluster{Config::Builder{}
                        .tickInterval(20ms)
                        .broadcastInterval(10ms)
                        .failureThreshold(200ms)
                        .receivePoll(5ms)};
    auto& p1 = cluster.node(0);
    auto& p2 = cluster.node(1);

    REQUIRE(p1.start().has_value());
    REQUIRE(p2.start().has_value());
    REQUIRE(p1.start().error().code() == core::ErrorCode::kInvalidState);

    std::this_thread::sleep_for(120ms);

    p1.stop();
    p2.stop();
    p2.stop();

    REQUIRE(p1.history().contains("p2"));
    REQUIRE(p2.history().contains("p1"));
    REQUIRE(cluster.sinks[1].boards > 0);
}

} // namespace ltr::engine
