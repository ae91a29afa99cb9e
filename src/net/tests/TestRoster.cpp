/**
 * @file TestRoster.cpp
 * @brief Unit tests for net::session::Roster and DeadNodeSet.
 */

#include <catch2/catch.hpp>

#include "ltr/net/session/DeadNodeSet.hpp"
#include "ltr/net/session/Roster.hpp"

namespace ltr::net::session {

namespace {

Roster makeRoster()
{
    Roster roster;
    REQUIRE(roster.add({"p1", "10.0.0.1:7001", {1, 1}, grid::Direction::Right, 0}));
    REQUIRE(roster.add({"p2", "10.0.0.2:7002", {8, 8}, grid::Direction::Left, 1}));
    REQUIRE(roster.add({"p3", "10.0.0.3:7003", {8, 1}, grid::Direction::Left, 2}));
    return roster;
}

} // namespace

TEST_CASE("Roster keeps registration order and leads from index 0", "[net][roster]")
{
    const auto roster = makeRoster();

    REQUIRE(roster.size() == 3);
    REQUIRE(roster.leader() == "p1");
    REQUIRE(roster.isLeader("p1"));
    REQUIRE_FALSE(roster.isLeader("p2"));
    REQUIRE(roster.peers()[2].id == "p3");
}

TEST_CASE("Roster refuses duplicate identities", "[net][roster]")
{
    auto roster = makeRoster();

    const auto again = roster.add({"p2", "10.0.0.9:7009", {0, 0}, grid::Direction::Up, 5});
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyExists);
    REQUIRE(roster.size() == 3);
}

TEST_CASE("Removing the leader promotes the next peer", "[net][roster]")
{
    auto roster = makeRoster();

    REQUIRE(roster.remove("p1"));
    REQUIRE(roster.leader() == "p2");
    REQUIRE(roster.isLeader("p2"));
    REQUIRE(roster.size() == 2);
}

TEST_CASE("Eviction is idempotent", "[net][roster]")
{
    auto roster = makeRoster();
    REQUIRE(roster.remove("p2"));

    const auto leaderBefore = roster.leader();
    REQUIRE_FALSE(roster.remove("p2"));
    REQUIRE_FALSE(roster.remove("nobody"));

    REQUIRE(roster.size() == 2);
    REQUIRE(roster.leader() == leaderBefore);
}

TEST_CASE("Roster lookups by identity and endpoint", "[net][roster]")
{
    auto roster = makeRoster();

    REQUIRE(roster.contains("p3"));
    REQUIRE(roster.find("p3")->position == grid::Position{8, 1});
    REQUIRE(roster.findByEndpoint("10.0.0.2:7002")->id == "p2");
    REQUIRE(roster.findByEndpoint("10.0.0.2:9999") == nullptr);

    roster.find("p3")->heading = grid::Direction::Down;
    REQUIRE(roster.find("p3")->heading == grid::Direction::Down);
}

TEST_CASE("Empty roster has no leader", "[net][roster]")
{
    Roster roster;
    REQUIRE(roster.empty());
    REQUIRE_FALSE(roster.leader().has_value());
    REQUIRE_FALSE(roster.isLeader("p1"));
}

TEST_CASE("DeadNodeSet keeps first insertion only", "[net][deadnodes]")
{
    DeadNodeSet dead;
    REQUIRE(dead.insert("p2"));
    REQUIRE(dead.insert("p4"));
    REQUIRE_FALSE(dead.insert("p2"));

    REQUIRE(dead.size() == 2);
    REQUIRE(dead.contains("p4"));
    REQUIRE(dead.ids()[0] == "p2");
}

} // namespace ltr::net::session
