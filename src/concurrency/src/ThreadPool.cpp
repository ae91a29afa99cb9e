// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.cpp
/// @brief Implementation of the fixed-size thread pool.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/concurrency/ThreadPool.hpp>
#include <ltr/core/Log.hpp>

#include <exception>
#include <format>

namespace ltr::concurrency {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

ThreadPool::ThreadPool(core::u32 threadCount, std::string name)
    : name_{std::move(name)}
{
    core::u32 count = (threadCount == 0)
        ? static_cast<core::u32>(std::thread::hardware_concurrency())
        : threadCount;

    if (count == 0)
    {
        count = 1;
    }

    workers_.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
    {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
    core::Log::debug(name_, std::format("{} workers", count));
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopping_.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }
    }

    cv_.notify_all();

    for (auto& worker : workers_)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(workers_.size());
}

core::u32 ThreadPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return static_cast<core::u32>(tasks_.size());
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void ThreadPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock{mutex_};
            cv_.wait(lock, [this] {
                return stopping_.load(std::memory_order_relaxed) || !tasks_.empty();
            });

            if (tasks_.empty())
            {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            core::Log::error(name_, std::format("detached task threw: {}", e.what()));
        }
    }
}

} // namespace ltr::concurrency
