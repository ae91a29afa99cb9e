/**
 * @file Constants.hpp
 * @brief Project-wide compile-time defaults.
 *
 * Timing, grid, room and wire limits are centralised here so that a single
 * header controls the fundamental operating parameters of a peer.  Runtime
 * overrides go through engine::Config::Builder.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef LTR_CORE_CONSTANTS_HPP
    #define LTR_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace ltr::core {

inline constexpr u32   kTickIntervalMs         = 500;
inline constexpr u32   kBroadcastIntervalMs    = 500;
inline constexpr u32   kHeartbeatTolerance     = 2;
inline constexpr u32   kReceivePollMs          = 100;

inline constexpr u32   kGridDimension          = 10;
inline constexpr u32   kMinGridDimension       = 2;
inline constexpr u32   kMaxGridDimension       = 255;

inline constexpr u32   kMinRoomSize            = 2;
inline constexpr u32   kMaxRoomSize            = 6;
inline constexpr u32   kAliveVictoryThreshold  = 1;

inline constexpr u32   kSenderThreads          = 4;
inline constexpr usize kMaxDatagramSize        = 65'507;
inline constexpr usize kMaxIdentityLength      = 64;
inline constexpr usize kMaxEndpointLength      = 255;

} // namespace ltr::core

#endif // LTR_CORE_CONSTANTS_HPP
