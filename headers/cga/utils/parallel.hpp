//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_PARALLEL_HPP
#define CGA_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Thread pool used to analyze independent graphs concurrently.
 *
 * Graph algorithms never mutate their input, so the call, dependency and
 * inheritance graphs can be processed on separate workers without locking.
 */

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

namespace cga::parallel {

    /**
     * Returns the number of hardware threads available.
     *
     * @return The number of threads, or 1 if detection fails.
     */
    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * A fixed-size pool of worker threads consuming a FIFO task queue.
     */
    class ThreadPool {
    public:
        /**
         * Creates a thread pool with the specified number of threads.
         *
         * @param num_threads Number of worker threads (0 = auto-detect).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Submits a task to the pool.
         *
         * Exceptions thrown by the task are delivered through the future.
         *
         * @throws std::runtime_error if the pool is shutting down.
         */
        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Process-wide pool shared by all analyzers.
     */
    inline ThreadPool& global_pool() {
        static ThreadPool pool;
        return pool;
    }

    /**
     * Maps a function over a collection in parallel, preserving order.
     *
     * @param items The items to transform.
     * @param f The transformation function.
     * @param pool The thread pool to use (default: global pool).
     * @return Transformed items, in input order.
     *
     * If a task throws, the first exception in input order is rethrown
     * once every task has finished, so no task outlives @p items or @p f.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool = global_pool())
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        std::vector<std::future<ResultType>> futures;
        futures.reserve(items.size());

        struct WaitForAll {
            std::vector<std::future<ResultType>>& pending;

            ~WaitForAll() {
                for (auto& future : pending) {
                    if (future.valid()) {
                        future.wait();
                    }
                }
            }
        } wait_for_all{futures};

        for (const auto& item : items) {
            futures.push_back(pool.submit([&f, &item]() {
                return f(item);
            }));
        }

        std::vector<ResultType> results;
        results.reserve(items.size());

        for (auto& future : futures) {
            results.push_back(future.get());
        }

        return results;
    }

}  // namespace cga::parallel

#endif //CGA_PARALLEL_HPP
