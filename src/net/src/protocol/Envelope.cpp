// /////////////////////////////////////////////////////////////////////////////
/// @file Envelope.cpp
/// @brief EnvelopeCodec implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/protocol/Envelope.hpp>
#include <ltr/net/protocol/Bitstream.hpp>
#include <ltr/net/protocol/Protocol.hpp>
#include <ltr/core/Constants.hpp>

#include <format>

namespace ltr::net::protocol {

namespace {

constexpr core::u32 kHeadingBits = 2;
constexpr core::u32 kMaxCoordinate = 0xFFFF;

core::Expected<void> writeIdentity(Bitstream& out, std::string_view id)
{
    if (id.empty() || id.size() > core::kMaxIdentityLength)
    {
        return core::makeError(core::ErrorCode::kSerializationFailed,
                               std::format("identity '{}' has invalid length", id));
    }
    return out.writeString(id);
}

core::Expected<void> writePosition(Bitstream& out, grid::Position pos)
{
    if (pos.x < 0 || pos.y < 0 ||
        static_cast<core::u32>(pos.x) > kMaxCoordinate ||
        static_cast<core::u32>(pos.y) > kMaxCoordinate)
    {
        return core::makeError(core::ErrorCode::kSerializationFailed,
                               std::format("position ({}, {}) not encodable", pos.x, pos.y));
    }
    out.writeU16(static_cast<core::u16>(pos.x));
    out.writeU16(static_cast<core::u16>(pos.y));
    return {};
}

core::Expected<grid::Position> readPosition(Bitstream& in)
{
    const auto x = LTR_TRY(in.readU16());
    const auto y = LTR_TRY(in.readU16());
    return grid::Position{static_cast<core::i32>(x), static_cast<core::i32>(y)};
}

core::Expected<std::string> readIdentity(Bitstream& in)
{
    auto id = LTR_TRY(in.readString());
    if (id.empty())
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed, "empty identity");
    }
    return id;
}

} // anonymous namespace

core::Expected<std::vector<core::byte>> EnvelopeCodec::encode(const Envelope& envelope)
{
    Bitstream out;

    core::u8 flags = static_cast<core::u8>(EnvelopeFlag::None);
    if (envelope.isLeader)          flags = flags | EnvelopeFlag::Leader;
    if (envelope.isDirectionChange) flags = flags | EnvelopeFlag::DirectionChange;
    if (envelope.isDeathReport)     flags = flags | EnvelopeFlag::DeathReport;
    if (!envelope.deadNodes.empty()) flags = flags | EnvelopeFlag::HasDeadNodes;
    if (!envelope.history.empty())   flags = flags | EnvelopeFlag::HasHistory;

    out.writeU32(kProtocolMagic);
    out.writeU8(kProtocolVersion);
    out.writeU8(flags);

    const auto& sender = envelope.sender;
    LTR_TRY_VOID(writeIdentity(out, sender.id));
    LTR_TRY_VOID(out.writeString(sender.endpoint));
    LTR_TRY_VOID(writePosition(out, sender.position));
    out.writeBits(static_cast<core::u32>(sender.heading), kHeadingBits);

    if (hasFlag(flags, EnvelopeFlag::HasDeadNodes))
    {
        if (envelope.deadNodes.size() > 0xFF)
        {
            return core::makeError(core::ErrorCode::kSerializationFailed, "too many dead nodes");
        }
        out.writeU8(static_cast<core::u8>(envelope.deadNodes.size()));
        for (const auto& id : envelope.deadNodes.ids())
        {
            LTR_TRY_VOID(writeIdentity(out, id));
        }
    }

    if (hasFlag(flags, EnvelopeFlag::HasHistory))
    {
        if (envelope.history.size() > 0xFF)
        {
            return core::makeError(core::ErrorCode::kSerializationFailed, "too many history entries");
        }
        out.writeU8(static_cast<core::u8>(envelope.history.size()));
        for (const auto& [id, trail] : envelope.history)
        {
            if (trail.size() > 0xFFFF)
            {
                return core::makeError(core::ErrorCode::kSerializationFailed,
                                       std::format("history of '{}' too long", id));
            }
            LTR_TRY_VOID(writeIdentity(out, id));
            out.writeU16(static_cast<core::u16>(trail.size()));
            for (const auto& pos : trail)
            {
                LTR_TRY_VOID(writePosition(out, pos));
            }
        }
    }

    const auto bytes = out.data();
    if (bytes.size() > core::kMaxDatagramSize)
    {
        return core::makeError(core::ErrorCode::kSerializationFailed,
                               std::format("envelope of {} bytes exceeds datagram limit", bytes.size()));
    }

    return std::vector<core::byte>{bytes.begin(), bytes.end()};
}

core::Expected<Envelope> EnvelopeCodec::decode(std::span<const core::byte> bytes)
{
    Bitstream in{bytes};

    const auto magic = LTR_TRY(in.readU32());
    if (magic != kProtocolMagic)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::format("bad magic 0x{:08X}", magic));
    }

    const auto version = LTR_TRY(in.readU8());
    if (version != kProtocolVersion)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::format("unsupported protocol version {}", version));
    }

    const auto flags = LTR_TRY(in.readU8());

    Envelope envelope;
    envelope.isLeader          = hasFlag(flags, EnvelopeFlag::Leader);
    envelope.isDirectionChange = hasFlag(flags, EnvelopeFlag::DirectionChange);
    envelope.isDeathReport     = hasFlag(flags, EnvelopeFlag::DeathReport);

    envelope.sender.id       = LTR_TRY(readIdentity(in));
    envelope.sender.endpoint = LTR_TRY(in.readString());
    envelope.sender.position = LTR_TRY(readPosition(in));

    const auto heading = grid::directionFromWire(LTR_TRY(in.readBits(kHeadingBits)));
    if (!heading)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed, "invalid heading");
    }
    envelope.sender.heading = *heading;

    if (hasFlag(flags, EnvelopeFlag::HasDeadNodes))
    {
        const auto count = LTR_TRY(in.readU8());
        for (core::u32 i = 0; i < count; ++i)
        {
            envelope.deadNodes.insert(LTR_TRY(readIdentity(in)));
        }
    }

    if (hasFlag(flags, EnvelopeFlag::HasHistory))
    {
        const auto count = LTR_TRY(in.readU8());
        for (core::u32 i = 0; i < count; ++i)
        {
            auto id = LTR_TRY(readIdentity(in));
            const auto length = LTR_TRY(in.readU16());

            std::vector<grid::Position> trail;
            trail.reserve(length);
            for (core::u32 j = 0; j < length; ++j)
            {
                trail.push_back(LTR_TRY(readPosition(in)));
            }
            envelope.history.insert_or_assign(std::move(id), std::move(trail));
        }
    }

    return envelope;
}

} // namespace ltr::net::protocol
