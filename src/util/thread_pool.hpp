#ifndef SAFEINTAKE_UTIL_THREAD_POOL_HPP
#define SAFEINTAKE_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool. Used to fan table redaction out over rows.
 *
 * Usage Example:
 *  @code
 *    safeintake::util::ThreadPool pool(4);
 *    auto done = pool.enqueue([&table, begin, end] { redactRows(table, begin, end); });
 *    done.get();   // rethrows anything the task threw
 *  @endcode
 */

namespace safeintake {
namespace util {

/**
 * @class ThreadPool
 * @brief Workers pull tasks from a shared FIFO queue. The destructor drains the
 *        queue and joins every worker.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero uses hardware concurrency.
     */
    explicit ThreadPool(std::size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    /**
     * @brief Schedule a callable. The returned future yields its result or
     *        rethrows its exception.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] { return !taskQueue_.empty() || stop_; });
                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            // packaged_task stores any exception in the future
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace safeintake

#endif // SAFEINTAKE_UTIL_THREAD_POOL_HPP
