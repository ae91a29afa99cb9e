// /////////////////////////////////////////////////////////////////////////////
/// @file Peer.hpp
/// @brief One session participant as seen by the local peer.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/grid/Direction.hpp>
#include <ltr/grid/Position.hpp>
#include <ltr/core/Types.hpp>

#include <string>

namespace ltr::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Peer
/// @brief Identity, endpoint and kinematic state of a participant.
///
/// @c slot is the stable board marker index assigned at bootstrap from the
/// initial roster order; it never changes when the roster shrinks.
// /////////////////////////////////////////////////////////////////////////////
struct Peer
{
    std::string     id;
    std::string     endpoint;
    grid::Position  position{};
    grid::Direction heading{grid::Direction::Up};
    core::u8        slot{0};

    [[nodiscard]] bool operator==(const Peer&) const = default;
};

} // namespace ltr::net::session
