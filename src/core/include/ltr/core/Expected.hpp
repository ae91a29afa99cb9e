/**
 * @file Expected.hpp
 * @brief Result type of every fallible LightTrail operation.
 *
 * Codec, transport, bootstrap and configuration calls return Expected<T>.
 * LTR_TRY / LTR_TRY_VOID chain them inside the envelope codec without
 * nesting. Both rely on GNU statement expressions (GCC, Clang).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef LTR_CORE_EXPECTED_HPP
    #define LTR_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace ltr::core {

/** @brief Value of type @p T, or the Error that prevented it. */
template <typename T>
using Expected = std::expected<T, Error>;

} // namespace ltr::core

/**
 * @brief Yield the value of @p expr, or return its error from the caller.
 *
 * @p expr is evaluated once. The caller's return type must be an
 * Expected of any value type.
 */
#define LTR_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_ltr_result = (expr);                                       \
        if (!_ltr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_ltr_result.error()));         \
        std::move(_ltr_result.value());                                    \
    })

/** @brief LTR_TRY for Expected<void>, usable as a statement. */
#define LTR_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_ltr_result = (expr);                                       \
        if (!_ltr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_ltr_result.error()));         \
    } while (false)

#endif // LTR_CORE_EXPECTED_HPP
