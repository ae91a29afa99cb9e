// /////////////////////////////////////////////////////////////////////////////
/// @file LoopbackTransport.hpp
/// @brief In-process datagram transport over a shared hub.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/net/transport/ITransport.hpp>
#include <ltr/core/NonCopyable.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ltr::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class LoopbackHub
/// @brief Mailbox switchboard shared by every @ref LoopbackTransport.
///
/// Endpoints can be taken down with @ref setLinkDown: traffic from or to a
/// downed endpoint is silently dropped, which models a crashed peer.
// /////////////////////////////////////////////////////////////////////////////
class LoopbackHub final : public core::NonCopyable<LoopbackHub>
{
public:
    LoopbackHub() = default;
    ~LoopbackHub() = default;

    /// @brief Silently drops all traffic from/to @p endpoint while @p down.
    void setLinkDown(const std::string& endpoint, bool down);

    /// @brief Datagrams delivered so far (dropped ones excluded).
    [[nodiscard]] core::u64 deliveredCount() const;

private:
    friend class LoopbackTransport;

    struct Datagram
    {
        std::vector<core::byte> bytes;
        std::string             from;
    };

    struct Mailbox
    {
        std::deque<Datagram>     queue;
        std::condition_variable  cv;
    };

    core::Expected<void> attach(const std::string& endpoint);
    void detach(const std::string& endpoint);
    core::Expected<void> deliver(const std::string& from, const std::string& to,
                                 std::span<const core::byte> bytes);
    bool waitFor(const std::string& endpoint, Datagram& out, core::Millis timeout);

    mutable std::mutex                                        mutex_;
    std::unordered_map<std::string, std::shared_ptr<Mailbox>> mailboxes_;
    std::unordered_set<std::string>                           down_;
    core::u64                                                 delivered_{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class LoopbackTransport
/// @brief @ref ITransport bound to one mailbox of a @ref LoopbackHub.
///
/// Sending to an endpoint with no open mailbox fails with
/// @c NetworkSendFailed, like an unreachable host.
// /////////////////////////////////////////////////////////////////////////////
class LoopbackTransport final : public ITransport,
                                public core::NonCopyable<LoopbackTransport>
{
public:
    LoopbackTransport(std::shared_ptr<LoopbackHub> hub, Endpoint local);
    ~LoopbackTransport() override;

    [[nodiscard]] core::Expected<void> open() override;
    void close() override;

    [[nodiscard]] core::Expected<core::u32> send(
        std::span<const core::byte> data,
        const Endpoint& destination) override;

    [[nodiscard]] core::Expected<core::u32> receive(
        std::span<core::byte> buffer,
        Endpoint& from,
        core::Millis timeout) override;

    [[nodiscard]] const char* name() const noexcept override;

private:
    std::shared_ptr<LoopbackHub> hub_;
    Endpoint                     local_;
    std::string                  key_;
    std::atomic<bool>            open_{false};
};

} // namespace ltr::net::transport
