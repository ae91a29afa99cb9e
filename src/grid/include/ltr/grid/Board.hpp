// /////////////////////////////////////////////////////////////////////////////
/// @file Board.hpp
/// @brief Fixed-size occupancy grid shared by the simulator and netcode.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/grid/Position.hpp>
#include <ltr/core/Types.hpp>

#include <span>
#include <vector>

namespace ltr::grid {

// /////////////////////////////////////////////////////////////////////////////
/// @enum CellKind
/// @brief Marker category stored in a board cell.
// /////////////////////////////////////////////////////////////////////////////
enum class CellKind : core::u8
{
    Empty,
    Trail,
    Head,
    Dead
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct Cell
/// @brief One board cell: a marker and the board slot of its owning peer.
///
/// @c slot is meaningless when @c kind is @c Empty.
// /////////////////////////////////////////////////////////////////////////////
struct Cell
{
    CellKind  kind{CellKind::Empty};
    core::u8  slot{0};

    [[nodiscard]] bool empty() const noexcept { return kind == CellKind::Empty; }
    [[nodiscard]] constexpr bool operator==(const Cell&) const noexcept = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Board
/// @brief Square grid of @ref Cell, indexed by (x, y).
///
/// Holds at most one marker per cell. Marking only ever replaces a marker
/// with another non-empty marker: a cell never reverts to empty.
/// Not thread-safe; the owner serialises access.
// /////////////////////////////////////////////////////////////////////////////
class Board
{
public:
    /// @param dimension Side length in cells.
    explicit Board(core::u32 dimension);

    [[nodiscard]] core::u32 dimension() const noexcept { return dimension_; }

    /// @brief @c true when @p pos lies inside [0, dimension).
    [[nodiscard]] bool inBounds(Position pos) const noexcept;

    /// @brief Clamps each coordinate of @p pos into the grid.
    [[nodiscard]] Position clamp(Position pos) const noexcept;

    /// @brief Returns the cell at @p pos, or an empty cell when out of bounds.
    [[nodiscard]] Cell at(Position pos) const noexcept;

    /// @brief @c true if @p pos is inside the grid and holds no marker.
    [[nodiscard]] bool isEmpty(Position pos) const noexcept;

    /// @brief Writes a marker.
    /// @return @c false (and no write) when @p pos is out of bounds or
    ///         @p kind is @c Empty.
    bool mark(Position pos, CellKind kind, core::u8 slot) noexcept;

    /// @brief Number of cells holding @p kind for @p slot.
    [[nodiscard]] core::u32 count(CellKind kind, core::u8 slot) const noexcept;

    /// @brief Row-major view of all cells.
    [[nodiscard]] std::span<const Cell> cells() const noexcept { return cells_; }

    [[nodiscard]] bool operator==(const Board&) const noexcept = default;

private:
    [[nodiscard]] core::usize indexOf(Position pos) const noexcept;

    core::u32          dimension_;
    std::vector<Cell>  cells_;
};

} // namespace ltr::grid
