// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.hpp
/// @brief Fixed-size thread pool running the systems of a wave.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hive/core/Types.hpp>
#include <hive/core/NonCopyable.hpp>
#include <hive/core/Expected.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace hive::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class ThreadPool
/// @brief Simple fixed-thread-count pool.
///
/// Workers pull tasks from a shared FIFO queue protected by a mutex +
/// condition variable.  Use @ref enqueue for tasks that return a value and
/// @ref enqueueDetached for fire-and-forget work.  Tasks must not throw;
/// callers wrap their bodies and report failures through their own
/// channels.
///
/// Call @ref shutdown to drain all queued tasks; the destructor calls
/// @c shutdown implicitly.  Submitting after shutdown is rejected.
// /////////////////////////////////////////////////////////////////////////////
class ThreadPool final : public core::NonCopyable<ThreadPool>
{
public:
    /// @brief Creates the pool with @p threadCount worker threads.
    /// @param threadCount Number of worker threads.  Zero means
    ///        @c std::thread::hardware_concurrency() (at least one).
    explicit ThreadPool(core::u32 threadCount = 0);

    /// @brief Drains pending tasks and joins all workers.
    ~ThreadPool();

    // --------------------------------------------------------------------- //
    //  Task submission                                                       //
    // --------------------------------------------------------------------- //

    /// @brief Enqueues a callable and returns its future.
    /// @return @c std::future holding the return value, or kInvalidState
    ///         once the pool is shutting down.
    template <typename F, typename... Args>
    [[nodiscard]] auto enqueue(F&& func, Args&&... args)
        -> core::Expected<std::future<std::invoke_result_t<F, Args...>>>;

    /// @brief Enqueues a fire-and-forget callable.
    /// @return kInvalidState once the pool is shutting down.
    template <typename F>
    [[nodiscard]] core::Expected<void> enqueueDetached(F&& func);

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Signals workers to finish and blocks until all pending tasks
    ///        are processed.
    void shutdown();

    /// @brief Returns the number of worker threads.
    [[nodiscard]] core::u32 threadCount() const noexcept;

    /// @brief Number of tasks queued but not yet picked up by a worker.
    [[nodiscard]] core::usize pendingCount() const;

    /// @brief True when called from one of this pool's workers.
    [[nodiscard]] bool isWorkerThread() const noexcept;

private:
    /// @brief Worker loop: waits on the CV and processes tasks.
    void workerLoop();

    [[nodiscard]] core::Expected<void> push(std::function<void()> task);

    std::vector<std::thread>            workers_;
    std::vector<std::thread::id>        workerIds_;
    std::deque<std::function<void()>>   tasks_;
    mutable std::mutex                  mutex_;
    std::condition_variable             cv_;
    std::atomic<bool>                   stopping_{false};
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename F, typename... Args>
auto ThreadPool::enqueue(F&& func, Args&&... args)
    -> core::Expected<std::future<std::invoke_result_t<F, Args...>>>
{
    using ReturnType = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(func), std::forward<Args>(args)...)
    );

    std::future<ReturnType> future = task->get_future();
    HIVE_TRY_VOID(push([task]() { (*task)(); }));
    return future;
}

template <typename F>
core::Expected<void> ThreadPool::enqueueDetached(F&& func)
{
    return push(std::function<void()>(std::forward<F>(func)));
}

} // namespace hive::concurrency
