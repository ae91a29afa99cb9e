// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.hpp
/// @brief Fixed-size worker pool for fire-and-forget outbound sends.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/core/Types.hpp>
#include <ltr/core/NonCopyable.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ltr::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class ThreadPool
/// @brief Simple fixed-thread-count pool.
///
/// Workers pull tasks from a shared FIFO queue protected by a mutex +
/// condition variable.  Work is submitted fire-and-forget through
/// @ref enqueueDetached.  An exception escaping a task is logged under the
/// pool's name and the worker keeps going.
///
/// Call @ref shutdown to drain all queued tasks; the destructor calls
/// @c shutdown implicitly.
// /////////////////////////////////////////////////////////////////////////////
class ThreadPool final : public core::NonCopyable<ThreadPool>
{
public:
    /// @brief Creates the pool with @p threadCount worker threads.
    /// @param threadCount Number of worker threads.  Zero means
    ///        @c std::thread::hardware_concurrency().
    /// @param name        Log tag of the pool.
    explicit ThreadPool(core::u32 threadCount = 0, std::string name = "POOL");

    /// @brief Drains pending tasks and joins all workers.
    ~ThreadPool();

    // --------------------------------------------------------------------- //
    //  Task submission                                                       //
    // --------------------------------------------------------------------- //

    /// @brief Enqueues a fire-and-forget callable.
    /// @return @c false once the pool is shutting down (task dropped).
    template <typename F>
    bool enqueueDetached(F&& func);

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Signals workers to finish and blocks until all pending tasks
    ///        are processed.
    void shutdown();

    /// @brief Returns the number of worker threads.
    [[nodiscard]] core::u32 threadCount() const noexcept;

    /// @brief Returns the number of tasks waiting for a worker.
    [[nodiscard]] core::u32 pendingCount() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    /// @brief Worker loop: waits on the CV and processes tasks.
    void workerLoop();

    std::string                         name_;
    std::vector<std::thread>            workers_;
    std::deque<std::function<void()>>   tasks_;
    mutable std::mutex                  mutex_;
    std::condition_variable             cv_;
    std::atomic<bool>                   stopping_{false};
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename F>
bool ThreadPool::enqueueDetached(F&& func)
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopping_.load(std::memory_order_relaxed))
        {
            return false;
        }
        tasks_.emplace_back(std::forward<F>(func));
    }
    cv_.notify_one();
    return true;
}

} // namespace ltr::concurrency
