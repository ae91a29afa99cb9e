// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/engine/Config.hpp>

#include <format>

namespace ltr::engine {

SpawnTable defaultSpawnTable()
{
    using grid::Direction;
    return SpawnTable{
        {"p1", Spawn{{1, 1}, Direction::Right}},
        {"p2", Spawn{{8, 8}, Direction::Left}},
        {"p3", Spawn{{8, 1}, Direction::Left}},
        {"p4", Spawn{{1, 8}, Direction::Right}},
        {"p5", Spawn{{4, 1}, Direction::Right}},
        {"p6", Spawn{{5, 8}, Direction::Left}},
    };
}

std::optional<Spawn> Config::spawnOf(std::string_view id) const
{
    const auto it = spawns_.find(id);
    if (it == spawns_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

Config::Builder::Builder()
    : spawns_{defaultSpawnTable()}
{}

Config::Builder& Config::Builder::tickInterval(core::Millis interval) noexcept
{
    tickInterval_ = interval;
    return *this;
}

Config::Builder& Config::Builder::broadcastInterval(core::Millis interval) noexcept
{
    broadcastInterval_ = interval;
    return *this;
}

Config::Builder& Config::Builder::failureThreshold(core::Millis threshold) noexcept
{
    failureThreshold_ = threshold;
    return *this;
}

Config::Builder& Config::Builder::heartbeatTolerance(core::u32 beats) noexcept
{
    heartbeatTolerance_ = beats;
    return *this;
}

Config::Builder& Config::Builder::gridDimension(core::u32 cells) noexcept
{
    gridDimension_ = cells;
    return *this;
}

Config::Builder& Config::Builder::roomSize(core::u32 peers) noexcept
{
    roomSize_ = peers;
    return *this;
}

Config::Builder& Config::Builder::spawn(std::string id, grid::Position position, grid::Direction heading)
{
    spawns_.insert_or_assign(std::move(id), Spawn{position, heading});
    return *this;
}

Config::Builder& Config::Builder::spawnTable(SpawnTable table)
{
    spawns_ = std::move(table);
    return *this;
}

Config::Builder& Config::Builder::selfEndpoint(std::string endpoint)
{
    selfEndpoint_ = std::move(endpoint);
    return *this;
}

Config::Builder& Config::Builder::receivePoll(core::Millis timeout) noexcept
{
    receivePoll_ = timeout;
    return *this;
}

Config::Builder& Config::Builder::senderThreads(core::u32 threads) noexcept
{
    senderThreads_ = threads;
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    const auto invalid = [](std::string message) {
        return core::makeError(core::ErrorCode::kInvalidArgument, std::move(message));
    };

    if (tickInterval_.count() <= 0 || broadcastInterval_.count() <= 0)
    {
        return invalid("tick and broadcast intervals must be positive");
    }
    if (receivePoll_.count() <= 0)
    {
        return invalid("receive poll timeout must be positive");
    }

    const core::Millis threshold = failureThreshold_.value_or(broadcastInterval_ * heartbeatTolerance_);
    if (threshold <= broadcastInterval_)
    {
        return invalid(std::format("failure threshold {}ms must exceed broadcast interval {}ms",
                                   threshold.count(), broadcastInterval_.count()));
    }

    if (gridDimension_ < core::kMinGridDimension || gridDimension_ > core::kMaxGridDimension)
    {
        return invalid(std::format("grid dimension {} outside [{}, {}]",
                                   gridDimension_, core::kMinGridDimension, core::kMaxGridDimension));
    }
    if (roomSize_ < core::kMinRoomSize || roomSize_ > core::kMaxRoomSize)
    {
        return invalid(std::format("room size {} outside [{}, {}]",
                                   roomSize_, core::kMinRoomSize, core::kMaxRoomSize));
    }

    const auto dim = static_cast<core::i32>(gridDimension_);
    for (const auto& [id, spawn] : spawns_)
    {
        const auto pos = spawn.position;
        if (pos.x < 0 || pos.y < 0 || pos.x >= dim || pos.y >= dim)
        {
            return invalid(std::format("spawn of '{}' at ({}, {}) is outside a {}x{} grid",
                                       id, pos.x, pos.y, dim, dim));
        }
    }

    if (selfEndpoint_.empty())
    {
        return invalid("self endpoint is required");
    }

    Config cfg;
    cfg.tickInterval_      = tickInterval_;
    cfg.broadcastInterval_ = broadcastInterval_;
    cfg.failureThreshold_  = threshold;
    cfg.gridDimension_     = gridDimension_;
    cfg.roomSize_          = roomSize_;
    cfg.spawns_            = spawns_;
    cfg.selfEndpoint_      = selfEndpoint_;
    cfg.receivePoll_       = receivePoll_;
    cfg.senderThreads_     = senderThreads_;
    return cfg;
}

} // namespace ltr::engine
