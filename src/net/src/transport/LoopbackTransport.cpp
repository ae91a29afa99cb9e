// /////////////////////////////////////////////////////////////////////////////
/// @file LoopbackTransport.cpp
/// @brief In-process transport implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/transport/LoopbackTransport.hpp>

#include <algorithm>
#include <cstring>
#include <format>

namespace ltr::net::transport {

// -------------------------------------------------------------------------- //
//  LoopbackHub                                                               //
// -------------------------------------------------------------------------- //

void LoopbackHub::setLinkDown(const std::string& endpoint, bool down)
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (down)
    {
        down_.insert(endpoint);
    }
    else
    {
        down_.erase(endpoint);
    }
}

core::u64 LoopbackHub::deliveredCount() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return delivered_;
}

core::Expected<void> LoopbackHub::attach(const std::string& endpoint)
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (mailboxes_.contains(endpoint))
    {
        return core::makeError(core::ErrorCode::kNetworkBindFailed,
                               std::format("endpoint '{}' already in use", endpoint));
    }
    mailboxes_.emplace(endpoint, std::make_shared<Mailbox>());
    return {};
}

void LoopbackHub::detach(const std::string& endpoint)
{
    std::shared_ptr<Mailbox> box;
    {
        std::lock_guard<std::mutex> lock{mutex_};
        const auto it = mailboxes_.find(endpoint);
        if (it == mailboxes_.end())
        {
            return;
        }
        box = it->second;
        mailboxes_.erase(it);
    }
    box->cv.notify_all();
}

core::Expected<void> LoopbackHub::deliver(const std::string& from, const std::string& to,
                                          std::span<const core::byte> bytes)
{
    std::shared_ptr<Mailbox> box;
    {
        std::lock_guard<std::mutex> lock{mutex_};
        const auto it = mailboxes_.find(to);
        if (it == mailboxes_.end())
        {
            return core::makeError(core::ErrorCode::kNetworkSendFailed,
                                   std::format("'{}' unreachable", to));
        }
        if (down_.contains(from) || down_.contains(to))
        {
            return {};
        }
        it->second->queue.push_back(Datagram{{bytes.begin(), bytes.end()}, from});
        ++delivered_;
        box = it->second;
    }
    box->cv.notify_one();
    return {};
}

bool LoopbackHub::waitFor(const std::string& endpoint, Datagram& out, core::Millis timeout)
{
    std::unique_lock<std::mutex> lock{mutex_};
    const auto it = mailboxes_.find(endpoint);
    if (it == mailboxes_.end())
    {
        return false;
    }

    const auto box = it->second;
    const bool ready = box->cv.wait_for(lock, timeout, [&] {
        return !box->queue.empty() || !mailboxes_.contains(endpoint);
    });

    if (!ready || box->queue.empty())
    {
        return false;
    }

    out = std::move(box->queue.front());
    box->queue.pop_front();
    return true;
}

// -------------------------------------------------------------------------- //
//  LoopbackTransport                                                         //
// -------------------------------------------------------------------------- //

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub, Endpoint local)
    : hub_{std::move(hub)}
    , local_{std::move(local)}
    , key_{local_.toString()}
{}

LoopbackTransport::~LoopbackTransport()
{
    close();
}

core::Expected<void> LoopbackTransport::open()
{
    auto attached = hub_->attach(key_);
    if (!attached)
    {
        return attached;
    }
    open_.store(true);
    return {};
}

void LoopbackTransport::close()
{
    if (open_.exchange(false))
    {
        hub_->detach(key_);
    }
}

core::Expected<core::u32> LoopbackTransport::send(
    std::span<const core::byte> data,
    const Endpoint& destination)
{
    if (!open_.load())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Loopback not open");
    }

    auto delivered = hub_->deliver(key_, destination.toString(), data);
    if (!delivered)
    {
        return std::unexpected(std::move(delivered.error()));
    }
    return static_cast<core::u32>(data.size());
}

core::Expected<core::u32> LoopbackTransport::receive(
    std::span<core::byte> buffer,
    Endpoint& from,
    core::Millis timeout)
{
    if (!open_.load())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Loopback not open");
    }

    LoopbackHub::Datagram datagram;
    if (!hub_->waitFor(key_, datagram, timeout))
    {
        return core::u32{0};
    }

    auto sender = Endpoint::parse(datagram.from);
    if (sender)
    {
        from = std::move(*sender);
    }

    const auto n = std::min(buffer.size(), datagram.bytes.size());
    std::memcpy(buffer.data(), datagram.bytes.data(), n);
    return static_cast<core::u32>(n);
}

const char* LoopbackTransport::name() const noexcept
{
    return "LoopbackTransport";
}

} // namespace ltr::net::transport
