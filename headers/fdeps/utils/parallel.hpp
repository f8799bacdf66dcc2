//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef FDEPS_PARALLEL_HPP
#define FDEPS_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Fixed-size worker pool with a shared task queue.
 *
 * Tasks are submitted as callables and observed through std::future. A pool
 * whose caller stopped waiting on a task (timeout) can be abandoned: its
 * workers are detached instead of joined on destruction, finish whatever
 * they are running, and exit. Queue state lives in a shared block owned by
 * the workers, so detached workers never touch a destroyed pool.
 */

#include <vector>
#include <future>
#include <thread>
#include <queue>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <type_traits>

namespace fdeps::parallel {

    /**
     * Returns the number of hardware threads available, or 1 if unknown.
     */
    inline unsigned int hardware_concurrency() noexcept {
        unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    class ThreadPool {
    public:
        /**
         * Creates a pool with the given number of workers (0 = hardware concurrency).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : state_(std::make_shared<State>()) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([state = state_] {
                    worker_loop(*state);
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(state_->mutex);
                state_->stop = true;
                if (abandoned_) {
                    std::queue<std::function<void()>> dropped;
                    state_->tasks.swap(dropped);
                }
            }
            state_->condition.notify_all();

            for (auto& worker : workers_) {
                if (!worker.joinable()) {
                    continue;
                }
                if (abandoned_) {
                    worker.detach();
                } else {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues a task and returns a future for its result.
         *
         * @throws std::runtime_error if the pool is shutting down.
         */
        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(state_->mutex);
                if (state_->stop) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                state_->tasks.emplace([task]() { (*task)(); });
            }

            state_->condition.notify_one();
            return result;
        }

        /**
         * Marks the pool as abandoned: pending tasks are dropped and workers
         * are detached rather than joined when the pool is destroyed.
         */
        void abandon() noexcept {
            abandoned_ = true;
        }

        [[nodiscard]] bool abandoned() const noexcept {
            return abandoned_;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        struct State {
            std::queue<std::function<void()>> tasks;
            std::mutex mutex;
            std::condition_variable condition;
            bool stop = false;
        };

        static void worker_loop(State& state) {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(state.mutex);
                    state.condition.wait(lock, [&state] {
                        return state.stop || !state.tasks.empty();
                    });

                    if (state.stop && state.tasks.empty()) {
                        return;
                    }

                    task = std::move(state.tasks.front());
                    state.tasks.pop();
                }

                task();
            }
        }

        std::shared_ptr<State> state_;
        std::vector<std::thread> workers_;
        bool abandoned_ = false;
    };

}  // namespace fdeps::parallel

#endif //FDEPS_PARALLEL_HPP
