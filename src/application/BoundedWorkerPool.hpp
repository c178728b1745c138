/**
 * @file BoundedWorkerPool.hpp
 * @brief Fixed-size thread pool used for concurrent fetch-and-extract work.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace versionlens::application {

/**
 * @class BoundedWorkerPool
 * @brief Runs submitted callables on at most N threads.
 *
 * The queue lives in shared state owned jointly by the pool and its workers, so
 * abandon() can return immediately while running tasks finish on their own.
 * Tasks must therefore not capture references to caller-owned locals.
 * Before the process exits, WaitForAbandoned() lets those tasks release what they hold.
 */
class BoundedWorkerPool {
public:
    explicit BoundedWorkerPool(size_t workers)
        : m_state(std::make_shared<State>()) {
        if (workers == 0) workers = 1;
        for (size_t i = 0; i < workers; ++i) {
            m_workers.emplace_back(&BoundedWorkerPool::WorkerLoop, m_state);
        }
    }

    ~BoundedWorkerPool() {
        stop();
    }

    BoundedWorkerPool(const BoundedWorkerPool&) = delete;
    BoundedWorkerPool& operator=(const BoundedWorkerPool&) = delete;

    /** @brief Queues a callable; its result or exception is delivered through the future. */
    template<typename F>
    std::future<std::invoke_result_t<F>> submit(F&& f) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->tasks.push([task]() { (*task)(); });
        }
        m_state->cv.notify_one();
        return future;
    }

    /** @brief Set once abandon() has been called; long-running tasks may poll it. */
    std::shared_ptr<const std::atomic<bool>> cancellationToken() const {
        return std::shared_ptr<const std::atomic<bool>>(m_state, &m_state->cancelled);
    }

    /** @brief Runs the remaining queue to completion and joins the workers. */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->running = false;
        }
        m_state->cv.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

    /** @brief Drops queued tasks and detaches the workers without waiting for running ones. */
    void abandon() {
        size_t detaching = 0;
        for (const auto& worker : m_workers) {
            if (worker.joinable()) ++detaching;
        }
        {
            Abandoned& abandoned = AbandonedWorkers();
            std::lock_guard<std::mutex> lock(abandoned.mutex);
            abandoned.running += detaching;
        }
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->running = false;
            m_state->cancelled = true;
            std::queue<std::function<void()>>().swap(m_state->tasks);
        }
        m_state->cv.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.detach();
        }
    }

    /**
     * @brief Blocks until every worker detached by abandon(), in any pool, has exited.
     * @return false if some are still running when the timeout expires.
     */
    static bool WaitForAbandoned(std::chrono::milliseconds timeout) {
        Abandoned& abandoned = AbandonedWorkers();
        std::unique_lock<std::mutex> lock(abandoned.mutex);
        return abandoned.cv.wait_for(lock, timeout, [&abandoned] { return abandoned.running == 0; });
    }

private:
    struct State {
        std::queue<std::function<void()>> tasks;
        std::mutex mutex;
        std::condition_variable cv;
        bool running = true;
        std::atomic<bool> cancelled{false};
    };

    struct Abandoned {
        std::mutex mutex;
        std::condition_variable cv;
        size_t running = 0;
    };

    // Never destroyed: detached workers may still report in during static destruction.
    static Abandoned& AbandonedWorkers() {
        static Abandoned* abandoned = new Abandoned();
        return *abandoned;
    }

    static void ReportExit(const State& state) {
        if (!state.cancelled.load()) return;
        Abandoned& abandoned = AbandonedWorkers();
        {
            std::lock_guard<std::mutex> lock(abandoned.mutex);
            --abandoned.running;
        }
        abandoned.cv.notify_all();
    }

    static void WorkerLoop(std::shared_ptr<State> state) {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                state->cv.wait(lock, [&state] {
                    return !state->tasks.empty() || !state->running;
                });

                if (state->tasks.empty()) {
                    lock.unlock();
                    ReportExit(*state);
                    return; // stopped and drained
                }
                task = std::move(state->tasks.front());
                state->tasks.pop();
            }
            task();
        }
    }

    std::shared_ptr<State> m_state;
    std::vector<std::thread> m_workers;
};

} // namespace versionlens::application
