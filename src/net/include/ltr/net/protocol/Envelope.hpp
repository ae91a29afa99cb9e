// /////////////////////////////////////////////////////////////////////////////
/// @file Envelope.hpp
/// @brief Peer-to-peer wire message and its codec.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/session/DeadNodeSet.hpp>
#include <ltr/net/session/History.hpp>
#include <ltr/net/session/Peer.hpp>
#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>

#include <span>
#include <vector>

namespace ltr::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Envelope
/// @brief Tagged message exchanged between peers.
///
/// At most one of the three tags is meaningful per message; an envelope
/// with none set is a periodic follower update (heartbeat + position).
/// @c deadNodes and @c history are only populated by the leader. The
/// receiver ignores fields irrelevant to the tag. @c sender.slot is local
/// bookkeeping and is not carried on the wire.
// /////////////////////////////////////////////////////////////////////////////
struct Envelope
{
    bool                  isLeader{false};
    bool                  isDirectionChange{false};
    bool                  isDeathReport{false};
    session::DeadNodeSet  deadNodes;
    session::Peer         sender;
    session::History      history;

    [[nodiscard]] bool operator==(const Envelope&) const = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class EnvelopeCodec
/// @brief Bitstream encoding of @ref Envelope.
///
/// Layout:
///   [magic:32][version:8][flags:8]
///   [sender id:str][sender endpoint:str][x:16][y:16][heading:2]
///   if HasDeadNodes: [count:8] count x [id:str]
///   if HasHistory:   [count:8] count x ([id:str][n:16] n x ([x:16][y:16]))
/// Strings are u8-length-prefixed. Trailing bytes are ignored.
// /////////////////////////////////////////////////////////////////////////////
class EnvelopeCodec final
{
public:
    EnvelopeCodec() = delete;

    /// @brief Serialises @p envelope.
    /// @return @c SerializationFailed when a field cannot be represented
    ///         (negative coordinate, over-long string, too many entries,
    ///         datagram over the size limit).
    [[nodiscard]] static core::Expected<std::vector<core::byte>> encode(const Envelope& envelope);

    /// @brief Parses one datagram.
    /// @return @c DeserializationFailed on truncation or bad field values,
    ///         @c ProtocolViolation on wrong magic or version.
    [[nodiscard]] static core::Expected<Envelope> decode(std::span<const core::byte> bytes);
};

} // namespace ltr::net::protocol
