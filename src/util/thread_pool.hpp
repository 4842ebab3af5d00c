#ifndef IDREDACT_UTIL_THREAD_POOL_HPP
#define IDREDACT_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <stdexcept>
#include <algorithm>
#include <type_traits>
#include <memory>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool. The batch driver uses it to redact many
 *        independent texts in parallel against one shared, read-only catalog.
 *
 * Usage Example:
 *  @code
 *    idredact::util::ThreadPool pool(4);
 *    auto fut = pool.enqueue([&](const std::string &t) { return redactor.redact(t); }, line);
 *    std::cout << fut.get() << std::endl;
 *  @endcode
 */

namespace idredact {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool.
 *
 * - Constructor spawns a given number of worker threads.
 * - enqueue(...) schedules a task and returns a future for its result.
 * - Destructor drains the queue and joins every worker.
 */
class ThreadPool
{
public:
    /**
     * @brief Spawn the worker threads.
     * @param threadCount Number of worker threads to create. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] {
                // Each worker pulls tasks until the pool stops and the queue is empty
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queueMutex_);
                        // Sleep until there is a task, or the pool is stopping
                        condVar_.wait(lock, [this] {
                            return !taskQueue_.empty() || stop_;
                        });

                        if (stop_ && taskQueue_.empty()) {
                            return;
                        }
                        // Pop a task from the queue
                        task = std::move(taskQueue_.front());
                        taskQueue_.pop();
                    }
                    // packaged_task stores any exception in the future
                    task();
                }
            });
        }
    }

    /**
     * @brief Stop accepting tasks, let the workers finish what is queued,
     *        then join them.
     */
    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        // Wake all threads
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Number of worker threads actually started.
    size_t threadCount() const { return workers_.size(); }

    /**
     * @brief Enqueue a task for asynchronous execution.
     * @tparam F A callable type (function, functor, lambda).
     * @tparam Args Parameter pack for arguments to F.
     * @param f The callable to execute.
     * @param args Arguments to pass to the callable.
     * @return A std::future holding the task's result or exception.
     * @throw std::runtime_error if the pool is already stopping.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        // Create a packaged task from the callable
        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

private:
    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Pending tasks, FIFO
    std::mutex queueMutex_;                          ///< Guards taskQueue_ and stop_
    std::condition_variable condVar_;                ///< Signalled on new task or stop
    bool stop_;                                      ///< Set once; no new tasks accepted after
};

} // namespace util
} // namespace idredact

#endif // IDREDACT_UTIL_THREAD_POOL_HPP
