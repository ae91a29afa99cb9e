// /////////////////////////////////////////////////////////////////////////////
/// @file Gossip.hpp
/// @brief Envelope fan-out and inbound decoding over an ITransport.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/protocol/Envelope.hpp>
#include <ltr/net/transport/ITransport.hpp>
#include <ltr/concurrency/ThreadPool.hpp>
#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>
#include <ltr/core/NonCopyable.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace ltr::net {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Inbound
/// @brief One successfully decoded datagram.
// /////////////////////////////////////////////////////////////////////////////
struct Inbound
{
    protocol::Envelope   envelope;
    transport::Endpoint  from;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Gossip
/// @brief Unreliable envelope dissemination.
///
/// Outbound envelopes are encoded once and handed to the sender pool as
/// one detached task per destination, so a slow or failing destination
/// never delays the others. Per-destination failures are logged and
/// counted. Without a pool, sends run inline on the caller's thread.
///
/// Inbound datagrams that fail to decode are logged and dropped; the next
/// call to @ref receive carries on with the following datagram.
// /////////////////////////////////////////////////////////////////////////////
class Gossip final : public core::NonCopyable<Gossip>
{
public:
    /// @param transport Opened transport; must outlive this object.
    /// @param senders   Pool for detached sends, or @c nullptr for inline.
    Gossip(transport::ITransport& transport, concurrency::ThreadPool* senders);
    ~Gossip();

    /// @brief Encodes @p envelope and sends it to one destination.
    /// @return @c SerializationFailed if the envelope cannot be encoded.
    [[nodiscard]] core::Expected<void> send(const protocol::Envelope& envelope,
                                            const transport::Endpoint& destination);

    /// @brief Encodes @p envelope once and sends it to every destination.
    /// @return Number of sends dispatched, or the encoding error.
    [[nodiscard]] core::Expected<core::u32> fanOut(const protocol::Envelope& envelope,
                                                   std::span<const transport::Endpoint> destinations);

    /// @brief Waits up to @p timeout for the next decodable envelope.
    /// @return @c nullopt on timeout, transport error or malformed payload.
    [[nodiscard]] std::optional<Inbound> receive(core::Millis timeout);

    [[nodiscard]] core::u64 sentCount() const noexcept { return sent_.load(); }
    [[nodiscard]] core::u64 sendFailureCount() const noexcept { return sendFailures_.load(); }
    [[nodiscard]] core::u64 droppedCount() const noexcept { return dropped_.load(); }

private:
    using Payload = std::shared_ptr<const std::vector<core::byte>>;

    void dispatch(Payload payload, transport::Endpoint destination);
    void transmit(const Payload& payload, const transport::Endpoint& destination);

    transport::ITransport&     transport_;
    concurrency::ThreadPool*   senders_;
    std::vector<core::byte>    receiveBuffer_;

    std::atomic<core::u64>     sent_{0};
    std::atomic<core::u64>     sendFailures_{0};
    std::atomic<core::u64>     dropped_{0};
};

} // namespace ltr::net
