// /////////////////////////////////////////////////////////////////////////////
/// @file Board.cpp
/// @brief Board implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/grid/Board.hpp>

#include <algorithm>

namespace ltr::grid {

Board::Board(core::u32 dimension)
    : dimension_{dimension}
    , cells_(static_cast<core::usize>(dimension) * dimension)
{}

bool Board::inBounds(Position pos) const noexcept
{
    const auto dim = static_cast<core::i32>(dimension_);
    return pos.x >= 0 && pos.y >= 0 && pos.x < dim && pos.y < dim;
}

Position Board::clamp(Position pos) const noexcept
{
    const auto last = static_cast<core::i32>(dimension_) - 1;
    return {std::clamp(pos.x, 0, last), std::clamp(pos.y, 0, last)};
}

Cell Board::at(Position pos) const noexcept
{
    if (!inBounds(pos))
    {
        return {};
    }
    return cells_[indexOf(pos)];
}

bool Board::isEmpty(Position pos) const noexcept
{
    return inBounds(pos) && cells_[indexOf(pos)].empty();
}

bool Board::mark(Position pos, CellKind kind, core::u8 slot) noexcept
{
    if (kind == CellKind::Empty || !inBounds(pos))
    {
        return false;
    }
    cells_[indexOf(pos)] = Cell{kind, slot};
    return true;
}

core::u32 Board::count(CellKind kind, core::u8 slot) const noexcept
{
    return static_cast<core::u32>(std::count(cells_.begin(), cells_.end(), Cell{kind, slot}));
}

core::usize Board::indexOf(Position pos) const noexcept
{
    return static_cast<core::usize>(pos.y) * dimension_ + static_cast<core::usize>(pos.x);
}

} // namespace ltr::grid
