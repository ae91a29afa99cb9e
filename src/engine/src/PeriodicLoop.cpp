/**
 * @file PeriodicLoop.cpp
 * @brief PeriodicLoop implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include <ltr/engine/PeriodicLoop.hpp>
#include <ltr/core/Log.hpp>

#include <exception>
#include <format>

namespace ltr::engine {

PeriodicLoop::PeriodicLoop(std::string name, core::Millis period)
    : _name{std::move(name)}
    , _period{period}
{
}

PeriodicLoop::~PeriodicLoop()
{
    stop();
}

core::Expected<void> PeriodicLoop::start(PeriodicBody body)
{
    if (_thread.joinable())
        return core::makeError(core::ErrorCode::kInvalidState, std::format("{} already started", _name));
    if (!body || _period.count() <= 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, std::format("{} needs a body and a period", _name));

    _stopRequested = false;
    _iterations = 0;
    _running = true;
    _thread = std::thread(&PeriodicLoop::run, this, std::move(body));
    return {};
}

void PeriodicLoop::requestStop() noexcept
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _stopRequested = true;
    }
    _wake.notify_all();
}

void PeriodicLoop::stop()
{
    requestStop();
    if (_thread.joinable())
        _thread.join();
}

bool PeriodicLoop::isRunning() const noexcept
{
    return _running;
}

core::u64 PeriodicLoop::iterationCount() const noexcept
{
    return _iterations;
}

void PeriodicLoop::run(PeriodicBody body)
{
    core::Log::debug(_name, std::format("started, period {}ms", _period.count()));

    auto deadline = core::Clock::now();

    while (!_stopRequested)
    {
        const auto now = core::Clock::now();
        try
        {
            body(now);
        }
        catch (const std::exception &e)
        {
            core::Log::error(_name, std::format("iteration failed: {}", e.what()));
        }
        ++_iterations;

        deadline += _period;
        const auto after = core::Clock::now();
        if (after > deadline + _period)
            deadline = after + _period;

        std::unique_lock<std::mutex> lock{_mutex};
        _wake.wait_until(lock, deadline, [this] { return _stopRequested.load(); });
    }

    _running = false;
    core::Log::debug(_name, "stopped");
}

} // namespace ltr::engine
