/**
 * @file PeriodicLoop.hpp
 * @brief Fixed-period loop running on its own thread.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef LTR_ENGINE_PERIODICLOOP_HPP
    #define LTR_ENGINE_PERIODICLOOP_HPP

#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ltr::engine {

/** @brief Body invoked once per period with the wake-up time. */
using PeriodicBody = std::function<void(core::TimePoint now)>;

/**
 * @brief Fixed-period loop (tick, broadcast, failure check).
 *
 * Deadlines advance by exactly one period per iteration so the cadence
 * does not drift with the body's run time. When the body overruns by more
 * than a whole period the schedule restarts from the current time rather
 * than firing a burst of catch-up iterations.
 *
 * The wait between iterations is interruptible: requestStop() wakes the
 * loop immediately.
 */
class PeriodicLoop
{
public:
    /// @param name   Log tag of the loop.
    /// @param period Interval between two body invocations.
    PeriodicLoop(std::string name, core::Millis period);
    ~PeriodicLoop();

    PeriodicLoop(const PeriodicLoop&) = delete;
    PeriodicLoop& operator=(const PeriodicLoop&) = delete;

    /**
     * @brief Spawn the loop thread.
     * @return InvalidState if the loop is already running.
     */
    [[nodiscard]] core::Expected<void> start(PeriodicBody body);

    /** @brief Ask the loop to exit after the current iteration. Safe from the body. */
    void requestStop() noexcept;

    /** @brief Request stop and join the thread. Must not be called from the body. */
    void stop();

    /** @brief Whether the loop thread is running. */
    [[nodiscard]] bool isRunning() const noexcept;

    /** @brief Iterations executed since start(). */
    [[nodiscard]] core::u64 iterationCount() const noexcept;

    [[nodiscard]] const std::string& name() const noexcept { return _name; }

private:
    void run(PeriodicBody body);

    std::string              _name;
    core::Millis             _period;
    std::thread              _thread;
    std::mutex               _mutex;
    std::condition_variable  _wake;
    std::atomic<bool>        _running{false};
    std::atomic<bool>        _stopRequested{false};
    std::atomic<core::u64>   _iterations{0};
};

} // namespace ltr::engine

#endif // LTR_ENGINE_PERIODICLOOP_HPP
