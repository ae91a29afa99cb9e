// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief LightTrail peer entry-point.
///
/// Usage: ltr_peer <self-host:port> <id@host:port>...
///
/// The roster on the command line stands in for matchmaking; its order is
/// the leadership order. Direction input is read from stdin, one of
/// U/D/L/R per line; "q" leaves the session.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/engine/Bootstrap.hpp>
#include <ltr/engine/Config.hpp>
#include <ltr/engine/IEventSink.hpp>
#include <ltr/engine/PeerNode.hpp>
#include <ltr/net/transport/Endpoint.hpp>
#include <ltr/net/transport/SocketTransport.hpp>
#include <ltr/grid/Direction.hpp>
#include <ltr/core/Log.hpp>
#include <ltr/core/Types.hpp>

#include <format>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char* argv[])
{
    using namespace ltr;

    core::Log::info("=== LightTrail Peer ===");

    if (argc < 3)
    {
        core::Log::fatal(std::format("usage: {} <self-host:port> <id@host:port>...", argv[0]));
        return 1;
    }

    auto config = engine::Config::Builder{}
        .selfEndpoint(argv[1])
        .build();
    if (!config)
    {
        core::Log::fatal(std::format("invalid configuration: {}", config.error().message()));
        return 1;
    }

    std::vector<engine::RosterEntry> entries;
    for (int i = 2; i < argc; ++i)
    {
        auto entry = engine::parseRosterEntry(argv[i]);
        if (!entry)
        {
            core::Log::fatal(entry.error().message());
            return 1;
        }
        entries.push_back(std::move(*entry));
    }

    auto seed = engine::bootstrap(*config, entries);
    if (!seed)
    {
        core::Log::fatal(std::format("bootstrap failed: {}", seed.error().message()));
        return 1;
    }

    auto local = net::transport::Endpoint::parse(config->selfEndpoint());
    if (!local)
    {
        core::Log::fatal(local.error().message());
        return 1;
    }

    net::transport::SocketTransport transport{std::move(*local)};
    if (auto opened = transport.open(); !opened)
    {
        core::Log::fatal(std::format("cannot listen on {}: {}", config->selfEndpoint(), opened.error().message()));
        return 1;
    }

    engine::LoggingEventSink sink;
    engine::PeerNode node{std::move(*config), std::move(*seed), transport, sink};

    if (auto started = node.start(); !started)
    {
        core::Log::fatal(started.error().message());
        transport.close();
        return 1;
    }

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line == "q")
        {
            break;
        }
        const auto heading = grid::parseDirection(line);
        if (!heading)
        {
            core::Log::warn("INPUT", std::format("unknown command '{}'", line));
            continue;
        }
        node.changeDirection(*heading);
    }

    if (!std::cin)
    {
        // No more input: keep racing until this peer is out of the game.
        while (node.phase() == engine::Phase::AlivePlaying)
        {
            std::this_thread::sleep_for(node.config().broadcastInterval());
        }
    }

    node.stop();
    transport.close();

    core::Log::info(std::format("'{}' left in phase {}", node.selfId(), engine::toString(node.phase())));
    return 0;
}
