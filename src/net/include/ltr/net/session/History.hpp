// /////////////////////////////////////////////////////////////////////////////
/// @file History.hpp
/// @brief Per-peer trail history aggregated by the leader.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/grid/Position.hpp>
#include <ltr/core/Types.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ltr::net::session {

/// @brief Identity to ordered positions since game start. The last entry of
///        each sequence is that peer's head; the rest is trail.
///        Ordered by identity so encodings are deterministic.
using History = std::map<std::string, std::vector<grid::Position>, std::less<>>;

/// @brief Identity to board slot, fixed at bootstrap. Outlives roster
///        evictions so the trails of evicted peers can still be painted.
using SlotTable = std::map<std::string, core::u8, std::less<>>;

} // namespace ltr::net::session
