// /////////////////////////////////////////////////////////////////////////////
/// @file DeadNodeSet.hpp
/// @brief Identities the leader has declared failed.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/core/Types.hpp>

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ltr::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class DeadNodeSet
/// @brief Append-only set of identities, kept in insertion order so the
///        wire encoding is stable.
// /////////////////////////////////////////////////////////////////////////////
class DeadNodeSet
{
public:
    DeadNodeSet() = default;

    /// @brief Records @p id. @return @c false if it was already present.
    bool insert(std::string_view id)
    {
        if (contains(id))
        {
            return false;
        }
        ids_.emplace_back(id);
        return true;
    }

    [[nodiscard]] bool contains(std::string_view id) const noexcept
    {
        return std::find(ids_.begin(), ids_.end(), id) != ids_.end();
    }

    [[nodiscard]] std::span<const std::string> ids() const noexcept { return ids_; }
    [[nodiscard]] core::u32 size() const noexcept { return static_cast<core::u32>(ids_.size()); }
    [[nodiscard]] bool empty() const noexcept { return ids_.empty(); }

    [[nodiscard]] bool operator==(const DeadNodeSet&) const = default;

private:
    std::vector<std::string> ids_;
};

} // namespace ltr::net::session
