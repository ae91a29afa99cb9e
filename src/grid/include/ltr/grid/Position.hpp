// /////////////////////////////////////////////////////////////////////////////
/// @file Position.hpp
/// @brief Integer grid coordinate.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/core/Types.hpp>

namespace ltr::grid {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Position
/// @brief Cell coordinate; @c x grows rightwards, @c y grows downwards.
// /////////////////////////////////////////////////////////////////////////////
struct Position
{
    core::i32 x{0};
    core::i32 y{0};

    [[nodiscard]] constexpr bool operator==(const Position&) const noexcept = default;
};

} // namespace ltr::grid
