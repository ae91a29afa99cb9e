// /////////////////////////////////////////////////////////////////////////////
/// @file Gossip.cpp
/// @brief Gossip implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/Gossip.hpp>
#include <ltr/core/Constants.hpp>
#include <ltr/core/Log.hpp>

#include <format>
#include <memory>

namespace ltr::net {

Gossip::Gossip(transport::ITransport& transport, concurrency::ThreadPool* senders)
    : transport_{transport}
    , senders_{senders}
    , receiveBuffer_(core::kMaxDatagramSize)
{}

Gossip::~Gossip() = default;

core::Expected<void> Gossip::send(const protocol::Envelope& envelope,
                                  const transport::Endpoint& destination)
{
    const auto sent = fanOut(envelope, std::span<const transport::Endpoint>{&destination, 1});
    if (!sent)
    {
        return std::unexpected(sent.error());
    }
    return {};
}

core::Expected<core::u32> Gossip::fanOut(const protocol::Envelope& envelope,
                                         std::span<const transport::Endpoint> destinations)
{
    auto encoded = protocol::EnvelopeCodec::encode(envelope);
    if (!encoded)
    {
        core::Log::error("GOSSIP", std::format("cannot encode envelope from '{}': {}",
                                               envelope.sender.id, encoded.error().message()));
        return std::unexpected(std::move(encoded.error()));
    }

    const auto payload = std::make_shared<const std::vector<core::byte>>(std::move(*encoded));
    for (const auto& destination : destinations)
    {
        dispatch(payload, destination);
    }
    return static_cast<core::u32>(destinations.size());
}

std::optional<Inbound> Gossip::receive(core::Millis timeout)
{
    transport::Endpoint from;
    const auto received = transport_.receive(receiveBuffer_, from, timeout);
    if (!received)
    {
        core::Log::warn("GOSSIP", std::format("{} receive failed: {}",
                                              transport_.name(), received.error().message()));
        return std::nullopt;
    }
    if (*received == 0)
    {
        return std::nullopt;
    }

    auto decoded = protocol::EnvelopeCodec::decode(
        std::span<const core::byte>{receiveBuffer_.data(), *received});
    if (!decoded)
    {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        core::Log::warn("GOSSIP", std::format("dropped malformed datagram from {} ({} bytes): {}",
                                              from.toString(), *received, decoded.error().message()));
        return std::nullopt;
    }

    return Inbound{std::move(*decoded), std::move(from)};
}

void Gossip::dispatch(Payload payload, transport::Endpoint destination)
{
    if (senders_ == nullptr)
    {
        transmit(payload, destination);
        return;
    }

    const bool queued = senders_->enqueueDetached(
        [this, payload, destination = std::move(destination)]() {
            transmit(payload, destination);
        });

    if (!queued)
    {
        core::Log::debug("GOSSIP", "sender pool stopped, outbound datagram discarded");
    }
}

void Gossip::transmit(const Payload& payload, const transport::Endpoint& destination)
{
    const auto sent = transport_.send(*payload, destination);
    if (!sent)
    {
        sendFailures_.fetch_add(1, std::memory_order_relaxed);
        core::Log::warn("GOSSIP", std::format("send to {} failed: {}",
                                              destination.toString(), sent.error().message()));
        return;
    }
    sent_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace ltr::net
