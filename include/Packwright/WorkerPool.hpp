// =================================================================
// include/Packwright/WorkerPool.hpp
// =================================================================
// Bounded worker pool that drops queued work on cancellation.

#pragma once

#include "Packwright/Cancellation.hpp"
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Packwright {

/**
 * @brief Runs submitted work on a bounded number of threads
 *
 * Used for per-app pipelines (bounded by --jobs) and for signing the
 * independent components of one nesting level.
 *
 * Each submission pairs the work with a fallback. Work that has not started
 * when the token is cancelled is never run: its fallback is invoked instead
 * and resolves the future, so every future handed out is eventually
 * satisfied. Work already running observes the token on its own.
 */
class WorkerPool {
public:
    WorkerPool(size_t num_threads, const CancellationToken& token) : m_token(token) {
        if (num_threads == 0) {
            num_threads = 1;
        }
        for (size_t i = 0; i < num_threads; ++i) {
            m_workers.emplace_back([this] { workLoop(); });
        }
    }

    /**
     * @brief Resolve or drop everything still queued, then join
     */
    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_ready.notify_all();
        for (std::thread& worker : m_workers) {
            worker.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue work with the fallback producing its result if it is dropped
     * @throws std::logic_error once the pool is shutting down
     */
    template <typename Work, typename Fallback>
    auto submit(Work&& work, Fallback&& fallback) -> std::future<std::invoke_result_t<Work>> {
        using Result = std::invoke_result_t<Work>;
        static_assert(std::is_same_v<Result, std::invoke_result_t<Fallback>>,
                      "work and fallback must produce the same type");

        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();

        Job job;
        job.run = [promise, work = std::forward<Work>(work)]() mutable { fulfil(*promise, work); };
        job.drop = [promise, fallback = std::forward<Fallback>(fallback)]() mutable { fulfil(*promise, fallback); };
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                throw std::logic_error("submit on a closed WorkerPool");
            }
            m_jobs.push_back(std::move(job));
        }
        m_ready.notify_one();
        return future;
    }

    size_t size() const { return m_workers.size(); }

    /**
     * @brief Number of submissions resolved by their fallback
     */
    size_t dropped() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

private:
    struct Job {
        std::function<void()> run;
        std::function<void()> drop;
    };

    const CancellationToken& m_token;
    std::vector<std::thread> m_workers;
    std::deque<Job> m_jobs;
    mutable std::mutex m_mutex;
    std::condition_variable m_ready;
    bool m_closed = false;
    size_t m_dropped = 0;

    template <typename Result, typename Fn>
    static void fulfil(std::promise<Result>& promise, Fn& fn) {
        try {
            if constexpr (std::is_void_v<Result>) {
                fn();
                promise.set_value();
            } else {
                promise.set_value(fn());
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }

    void workLoop() {
        while (true) {
            Job job;
            bool cancelled = false;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_ready.wait(lock, [this] { return m_closed || !m_jobs.empty(); });
                if (m_jobs.empty()) {
                    return;
                }
                job = std::move(m_jobs.front());
                m_jobs.pop_front();

                cancelled = m_token.isCancelled();
                if (cancelled) {
                    ++m_dropped;
                }
            }

            if (cancelled) {
                job.drop();
            } else {
                job.run();
            }
        }
    }
};

} // namespace Packwright
