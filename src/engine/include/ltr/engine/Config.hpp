// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Session configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises timing, grid and spawn parameters of a peer.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ltr/grid/Direction.hpp>
#include <ltr/grid/Position.hpp>
#include <ltr/core/Types.hpp>
#include <ltr/core/Constants.hpp>
#include <ltr/core/Expected.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ltr::engine {

/// @brief Initial cell and heading of one identity.
struct Spawn
{
    grid::Position  position{};
    grid::Direction heading{grid::Direction::Up};

    [[nodiscard]] bool operator==(const Spawn&) const = default;
};

using SpawnTable = std::map<std::string, Spawn, std::less<>>;

/// @brief The six-seat table p1..p6 used when none is configured.
[[nodiscard]] SpawnTable defaultSpawnTable();

/// @brief Immutable session configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder();

        Builder& tickInterval(core::Millis interval) noexcept;
        Builder& broadcastInterval(core::Millis interval) noexcept;

        /// @brief Sets the failure threshold explicitly.
        Builder& failureThreshold(core::Millis threshold) noexcept;

        /// @brief Derives the threshold as @p beats broadcast intervals.
        ///        Ignored once an explicit threshold is set.
        Builder& heartbeatTolerance(core::u32 beats) noexcept;

        Builder& gridDimension(core::u32 cells) noexcept;
        Builder& roomSize(core::u32 peers) noexcept;

        /// @brief Adds or overrides the spawn of @p id.
        Builder& spawn(std::string id, grid::Position position, grid::Direction heading);
        Builder& spawnTable(SpawnTable table);

        Builder& selfEndpoint(std::string endpoint);
        Builder& receivePoll(core::Millis timeout) noexcept;

        /// @brief Outbound sender threads; zero sends inline on the caller.
        Builder& senderThreads(core::u32 threads) noexcept;

        /// @brief Validates and freezes the configuration.
        /// @return @c InvalidArgument describing the first violated rule.
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        core::Millis                 tickInterval_{core::kTickIntervalMs};
        core::Millis                 broadcastInterval_{core::kBroadcastIntervalMs};
        std::optional<core::Millis>  failureThreshold_;
        core::u32                    heartbeatTolerance_{core::kHeartbeatTolerance};
        core::u32                    gridDimension_{core::kGridDimension};
        core::u32                    roomSize_{core::kMaxRoomSize};
        SpawnTable                   spawns_;
        std::string                  selfEndpoint_;
        core::Millis                 receivePoll_{core::kReceivePollMs};
        core::u32                    senderThreads_{core::kSenderThreads};
    };

    [[nodiscard]] core::Millis       tickInterval()      const noexcept { return tickInterval_; }
    [[nodiscard]] core::Millis       broadcastInterval() const noexcept { return broadcastInterval_; }
    [[nodiscard]] core::Millis       failureThreshold()  const noexcept { return failureThreshold_; }
    [[nodiscard]] core::u32          gridDimension()     const noexcept { return gridDimension_; }
    [[nodiscard]] core::u32          roomSize()          const noexcept { return roomSize_; }
    [[nodiscard]] const SpawnTable&  spawns()            const noexcept { return spawns_; }
    [[nodiscard]] const std::string& selfEndpoint()      const noexcept { return selfEndpoint_; }
    [[nodiscard]] core::Millis       receivePoll()       const noexcept { return receivePoll_; }
    [[nodiscard]] core::u32          senderThreads()     const noexcept { return senderThreads_; }

    /// @brief Spawn of @p id, if configured.
    [[nodiscard]] std::optional<Spawn> spawnOf(std::string_view id) const;

private:
    Config() = default;

    core::Millis  tickInterval_{core::kTickIntervalMs};
    core::Millis  broadcastInterval_{core::kBroadcastIntervalMs};
    core::Millis  failureThreshold_{core::kBroadcastIntervalMs * core::kHeartbeatTolerance};
    core::u32     gridDimension_{core::kGridDimension};
    core::u32     roomSize_{core::kMaxRoomSize};
    SpawnTable    spawns_;
    std::string   selfEndpoint_;
    core::Millis  receivePoll_{core::kReceivePollMs};
    core::u32     senderThreads_{core::kSenderThreads};
};

} // namespace ltr::engine
