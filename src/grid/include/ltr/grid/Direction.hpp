// /////////////////////////////////////////////////////////////////////////////
/// @file Direction.hpp
/// @brief Cardinal headings and single-cell stepping.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/grid/Position.hpp>
#include <ltr/core/Types.hpp>

#include <optional>
#include <string_view>

namespace ltr::grid {

// /////////////////////////////////////////////////////////////////////////////
/// @enum Direction
/// @brief Heading of a peer. The underlying value is the wire encoding.
// /////////////////////////////////////////////////////////////////////////////
enum class Direction : core::u8
{
    Up    = 0,
    Down  = 1,
    Left  = 2,
    Right = 3
};

/// @brief Returns @p from moved one cell along @p heading (unclamped).
[[nodiscard]] constexpr Position step(Position from, Direction heading) noexcept
{
    switch (heading)
    {
    case Direction::Up:    return {from.x, from.y - 1};
    case Direction::Down:  return {from.x, from.y + 1};
    case Direction::Left:  return {from.x - 1, from.y};
    case Direction::Right: return {from.x + 1, from.y};
    }
    return from;
}

/// @brief Single-letter name (U, D, L, R).
[[nodiscard]] char toChar(Direction heading) noexcept;

/// @brief Parses U/D/L/R (case-insensitive); @c nullopt otherwise.
[[nodiscard]] std::optional<Direction> parseDirection(std::string_view text) noexcept;

/// @brief Decodes a wire value; @c nullopt when out of range.
[[nodiscard]] std::optional<Direction> directionFromWire(core::u32 value) noexcept;

} // namespace ltr::grid
