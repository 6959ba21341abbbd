// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.cpp
/// @brief Implementation of the fixed-size thread pool.
// /////////////////////////////////////////////////////////////////////////////

#include <hive/concurrency/ThreadPool.hpp>
#include <hive/core/Log.hpp>

#include <algorithm>
#include <string>

namespace hive::concurrency {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

ThreadPool::ThreadPool(core::u32 threadCount)
{
    const core::u32 count = (threadCount == 0)
        ? std::max(1u, static_cast<core::u32>(std::thread::hardware_concurrency()))
        : threadCount;

    {
        std::lock_guard<std::mutex> lock{mutex_};
        workers_.reserve(count);
        workerIds_.reserve(count);
        for (core::u32 i = 0; i < count; ++i)
        {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
            workerIds_.push_back(workers_.back().get_id());
        }
    }

    core::Log::debug("ThreadPool", "started " + std::to_string(count) + " workers");
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

core::usize ThreadPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return tasks_.size();
}

bool ThreadPool::isWorkerThread() const noexcept
{
    const auto self = std::this_thread::get_id();
    return std::find(workerIds_.begin(), workerIds_.end(), self) != workerIds_.end();
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

core::Expected<void> ThreadPool::push(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopping_.load(std::memory_order_relaxed))
        {
            return core::makeError(core::ErrorCode::kInvalidState, "ThreadPool is shutting down");
        }
        tasks_.emplace_back(std::move(task));
    }
    cv_.notify_one();
    return {};
}

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

        task();
    }
}

} // namespace hive::concurrency
