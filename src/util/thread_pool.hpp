#ifndef PIIGUARD_UTIL_THREAD_POOL_HPP
#define PIIGUARD_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <algorithm>
#include <exception>
#include "logger.hpp"

/**
 * @file thread_pool.hpp
 * @brief A fixed-size worker pool. The HTTP host hands each accepted
 *        connection to it, so concurrent redaction runs execute side by side,
 *        each with its own per-run state.
 *
 * Usage Example:
 *  @code
 *    piiguard::util::ThreadPool pool(4, 64);
 *    if (!pool.trySubmit([fd, this] { handleClient(fd); })) {
 *        // backlog full or pool stopping: answer 503 and close
 *    }
 *  @endcode
 */

namespace piiguard {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool with a bounded job backlog.
 *
 * - Constructor spawns the worker threads.
 * - trySubmit(...) queues a job unless the backlog is full or the pool is stopping.
 * - A job that throws is logged and does not take its worker down.
 * - Destructor drains queued jobs, then joins the workers.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. If zero, uses hardware concurrency.
     * @param maxBacklog Jobs allowed to wait for a worker. Zero means unbounded.
     */
    explicit ThreadPool(size_t threadCount = 0, size_t maxBacklog = 0)
        : maxBacklog_(maxBacklog)
        , stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
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

    /**
     * @brief Queue a job for asynchronous execution.
     * @return false if the pool is stopping or the backlog is full.
     */
    bool trySubmit(std::function<void()> job)
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                return false;
            }
            if (maxBacklog_ != 0 && jobs_.size() >= maxBacklog_) {
                return false;
            }
            jobs_.push(std::move(job));
        }
        condVar_.notify_one();
        return true;
    }

    size_t size() const { return workers_.size(); }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] { return !jobs_.empty() || stop_; });
                if (stop_ && jobs_.empty()) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop();
            }
            try {
                job();
            }
            catch (const std::exception &ex) {
                logger::error(std::string("ThreadPool: job failed: ") + ex.what());
            }
            catch (...) {
                logger::error("ThreadPool: job failed with a non-standard exception");
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    size_t maxBacklog_;                       ///< 0 = unbounded
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_THREAD_POOL_HPP
