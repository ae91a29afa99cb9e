// /////////////////////////////////////////////////////////////////////////////
/// @file Direction.cpp
/// @brief Direction conversions.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/grid/Direction.hpp>

namespace ltr::grid {

char toChar(Direction heading) noexcept
{
    switch (heading)
    {
    case Direction::Up:    return 'U';
    case Direction::Down:  return 'D';
    case Direction::Left:  return 'L';
    case Direction::Right: return 'R';
    }
    return '?';
}

std::optional<Direction> parseDirection(std::string_view text) noexcept
{
    if (text.size() != 1)
    {
        return std::nullopt;
    }

    switch (text.front())
    {
    case 'U': case 'u': return Direction::Up;
    case 'D': case 'd': return Direction::Down;
    case 'L': case 'l': return Direction::Left;
    case 'R': case 'r': return Direction::Right;
    default:            return std::nullopt;
    }
}

std::optional<Direction> directionFromWire(core::u32 value) noexcept
{
    if (value > static_cast<core::u32>(Direction::Right))
    {
        return std::nullopt;
    }
    return static_cast<Direction>(value);
}

} // namespace ltr::grid
