/**
 * @file TestGossip.cpp
 * @brief Unit tests for net::Gossip over the loopback transport.
 */

#include <catch2/catch.hpp>

#include "ltr/net/Gossip.hpp"
#include "ltr/net/transport/LoopbackTransport.hpp"
#include "ltr/concurrency/ThreadPool.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace ltr::net {

using namespace std::chrono_literals;
using transport::Endpoint;
using transport::LoopbackHub;
using transport::LoopbackTransport;

namespace {

protocol::Envelope heartbeat(const char *id)
{
    protocol::Envelope env;
    env.sender = {id, std::string{id} + ":7000", {2, 2}, grid::Direction::Down, 0};
    return env;
}

} // namespace

TEST_CASE("Loopback delivers datagrams between attached endpoints", "[net][loopback]")
{
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackTransport a{hub, {"a", 1}};
    LoopbackTransport b{hub, {"b", 2}};
    REQUIRE(a.open());
    REQUIRE(b.open());

    SECTION("second bind on the same endpoint fails")
    {
        LoopbackTransport clash{hub, {"a", 1}};
        REQUIRE(clash.open().error().code() == core::ErrorCode::kNetworkBindFailed);
    }

    SECTION("payload and sender survive the trip")
    {
        const std::vector<core::byte> payload{core::byte{1}, core::byte{2}, core::byte{3}};
        REQUIRE(a.send(payload, {"b", 2}).value() == 3);

        std::vector<core::byte> buffer(16);
        Endpoint from;
        REQUIRE(b.receive(buffer, from, 100ms).value() == 3);
        REQUIRE(from == Endpoint{"a", 1});
        REQUIRE(buffer[2] == core::byte{3});
        REQUIRE(hub->deliveredCount() == 1);
    }

    SECTION("receive times out with zero bytes")
    {
        std::vector<core::byte> buffer(16);
        Endpoint from;
        REQUIRE(b.receive(buffer, from, 10ms).value() == 0);
    }

    SECTION("unknown destination is a send failure")
    {
        const std::vector<core::byte> payload{core::byte{9}};
        REQUIRE(a.send(payload, {"nowhere", 9}).error().code() == core::ErrorCode::kNetworkSendFailed);
    }

    SECTION("a downed link silently loses traffic")
    {
        hub->setLinkDown("a:1", true);
        const std::vector<core::byte> payload{core::byte{9}};
        REQUIRE(a.send(payload, {"b", 2}).has_value());

        std::vector<core::byte> buffer(16);
        Endpoint from;
        REQUIRE(b.receive(buffer, from, 10ms).value() == 0);
        REQUIRE(hub->deliveredCount() == 0);
    }
}

TEST_CASE("Gossip fans out to every destination despite failures", "[net][gossip]")
{
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackTransport p1{hub, {"p1", 7000}};
    LoopbackTransport p2{hub, {"p2", 7000}};
    LoopbackTransport p3{hub, {"p3", 7000}};
    REQUIRE(p1.open());
    REQUIRE(p2.open());
    REQUIRE(p3.open());

    Gossip sender{p1, nullptr};
    Gossip inbox2{p2, nullptr};
    Gossip inbox3{p3, nullptr};

    const std::vector<Endpoint> destinations{{"p2", 7000}, {"gone", 7000}, {"p3", 7000}};
    const auto dispatched = sender.fanOut(heartbeat("p1"), destinations);

    REQUIRE(dispatched.value() == 3);
    REQUIRE(sender.sentCount() == 2);
    REQUIRE(sender.sendFailureCount() == 1);

    const auto at2 = inbox2.receive(50ms);
    const auto at3 = inbox3.receive(50ms);
    REQUIRE(at2.has_value());
    REQUIRE(at3.has_value());
    REQUIRE(at2->envelope.sender.id == "p1");
    REQUIRE(at3->from == Endpoint{"p1", 7000});
}

TEST_CASE("Gossip dispatches through the sender pool", "[net][gossip]")
{
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackTransport p1{hub, {"p1", 7000}};
    LoopbackTransport p2{hub, {"p2", 7000}};
    REQUIRE(p1.open());
    REQUIRE(p2.open());

    concurrency::ThreadPool pool{2};
    Gossip sender{p1, &pool};
    Gossip inbox{p2, nullptr};

    const std::vector<Endpoint> destinations{{"p2", 7000}};
    for (int i = 0; i < 5; ++i)
        REQUIRE(sender.fanOut(heartbeat("p1"), destinations).has_value());

    pool.shutdown();
    REQUIRE(sender.sentCount() == 5);

    int received = 0;
    while (inbox.receive(20ms))
        ++received;
    REQUIRE(received == 5);
}

TEST_CASE("Gossip drops malformed datagrams and keeps receiving", "[net][gossip]")
{
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackTransport p1{hub, {"p1", 7000}};
    LoopbackTransport p2{hub, {"p2", 7000}};
    REQUIRE(p1.open());
    REQUIRE(p2.open());

    Gossip sender{p1, nullptr};
    Gossip inbox{p2, nullptr};

    const std::vector<core::byte> garbage{core::byte{0xDE}, core::byte{0xAD}};
    REQUIRE(p1.send(garbage, {"p2", 7000}).has_value());
    REQUIRE(sender.send(heartbeat("p1"), {"p2", 7000}).has_value());

    REQUIRE_FALSE(inbox.receive(50ms).has_value());
    REQUIRE(inbox.droppedCount() == 1);

    const auto next = inbox.receive(50ms);
    REQUIRE(next.has_value());
    REQUIRE(next->envelope.sender.id == "p1");
}

TEST_CASE("Gossip reports unencodable envelopes", "[net][gossip]")
{
    auto hub = std::make_shared<LoopbackHub>();
    LoopbackTransport p1{hub, {"p1", 7000}};
    REQUIRE(p1.open());
    Gossip sender{p1, nullptr};

    auto env = heartbeat("p1");
    env.sender.position = {-3, 0};

    const auto result = sender.send(env, {"p2", 7000});
    REQUIRE(result.error().code() == core::ErrorCode::kSerializationFailed);
    REQUIRE(sender.sentCount() == 0);
}

} // namespace ltr::net
