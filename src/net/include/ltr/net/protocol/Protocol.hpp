/**
 * @file Protocol.hpp
 * @brief Wire protocol constants and envelope flag layout.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#pragma once

#ifndef LTR_NET_PROTOCOL_PROTOCOL_HPP
    #define LTR_NET_PROTOCOL_PROTOCOL_HPP

#include <ltr/core/Types.hpp>

namespace ltr::net::protocol {

/**
 * @brief Magic bytes identifying LightTrail envelopes on the wire ("LTR\0").
 */
static constexpr core::u32 kProtocolMagic = 0x4C545200;

/** @brief Current protocol version. */
static constexpr core::u8 kProtocolVersion = 1;

/**
 * @enum EnvelopeFlag
 * @brief Bit-flags stored in the envelope flag byte.
 *
 * Layout (1 byte, MSB first):
 *   [leader][directionChange][deathReport][hasDeadNodes][hasHistory][pad:3]
 *
 * The presence bits let a decoder default absent optional sections to
 * empty.
 */
enum class EnvelopeFlag : core::u8
{
    None            = 0x00,
    Leader          = 0x80,
    DirectionChange = 0x40,
    DeathReport     = 0x20,
    HasDeadNodes    = 0x10,
    HasHistory      = 0x08
};

[[nodiscard]] inline constexpr core::u8 operator|(EnvelopeFlag a, EnvelopeFlag b) noexcept
{
    return static_cast<core::u8>(static_cast<core::u8>(a) | static_cast<core::u8>(b));
}

[[nodiscard]] inline constexpr core::u8 operator|(core::u8 flags, EnvelopeFlag f) noexcept
{
    return static_cast<core::u8>(flags | static_cast<core::u8>(f));
}

[[nodiscard]] inline constexpr bool hasFlag(core::u8 flags, EnvelopeFlag f) noexcept
{
    return (flags & static_cast<core::u8>(f)) != 0;
}

} // namespace ltr::net::protocol

#endif // LTR_NET_PROTOCOL_PROTOCOL_HPP
