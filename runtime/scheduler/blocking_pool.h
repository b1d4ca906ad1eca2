#pragma once
#include <algorithm>
#include <concepts>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <libassert/assert.hpp>

#include "../../config/config.h"
#include "../../log/log.h"
#include "../../parker/thread_parker.h"
#include "../../sync/guard.h"
#include "../../sync/spinlock.h"
#include "../errors.h"
#include "worker_thread.h"

namespace tether {
    /**
    * @brief Bounded set of worker threads that run blocking calls off the event loops.
    *
    * Jobs run in submission order on whichever worker is free; at most size() jobs run at once
    * and unrelated jobs are never serialized beyond that bound. Idle workers park until a job
    * arrives. stop() refuses new jobs, lets the workers drain what is queued, and joins them.
    */
    class blocking_pool {
    public:
        using job_type = std::move_only_function<void() noexcept>;

        explicit blocking_pool(const std::uint32_t threadCount = runtime_config::default_blocking_threads(),
                               const std::string_view namePrefix = "tether")
        {
            const auto count = std::max(1u, threadCount);

            m_queue.with_lock([count](queue_state& queue) { queue.idle.reserve(count); });
            m_parkingLot.reserve(count);
            m_threads.reserve(count);

            for (std::uint32_t i = 0; i < count; i++) {
                m_parkingLot.emplace_back(std::make_unique<thread_parker>());
            }

            try {
                for (std::uint32_t i = 0; i < count; i++) {
                    m_threads.emplace_back([this, i] { this->worker(i); });
                    m_threads[i].set_thread_name(std::string(namePrefix) + "_blk_" + std::to_string(i));
                }
            }
            catch (...) {
                stop();
                throw;
            }

            logger::debug("blocking_pool started with ", count, " worker threads");
        }

        blocking_pool(const blocking_pool&) = delete;
        blocking_pool& operator=(const blocking_pool&) = delete;

        ~blocking_pool() { stop(); }

        // Process-wide pool used by run_blocking, sized by config() on first use.
        [[nodiscard]] static blocking_pool& global() {
            static blocking_pool globalInstance(config().blocking_threads, config().thread_name_prefix);
            return globalInstance;
        }

        /**
        * @brief Queues a job for a worker thread.
        *
        * @return @c false if the pool is stopped; the job is then discarded without running.
        */
        [[nodiscard]] bool execute(job_type job) {
            std::optional<std::uint32_t> sleeper;

            const bool accepted = m_queue.with_lock([&](queue_state& queue) {
                if (queue.stopped) {
                    return false;
                }

                queue.jobs.push_back(std::move(job));
                if (!queue.idle.empty()) {
                    sleeper = queue.idle.back();
                    queue.idle.pop_back();
                }
                return true;
            });

            if (sleeper) {
                DEBUG_ASSERT(sleeper.value() < m_parkingLot.size());
                m_parkingLot[sleeper.value()]->unpark();
            }
            return accepted;
        }

        /**
        * @brief Runs fnc(args...) on a worker and returns a future for its result.
        *
        * @throws pool_stopped if the pool no longer accepts work.
        */
        template<class Fnc, class... Args>
        requires std::invocable<std::decay_t<Fnc>, std::decay_t<Args>...>
        auto submit(Fnc&& fnc, Args&&... args) {
            using return_type = std::invoke_result_t<std::decay_t<Fnc>, std::decay_t<Args>...>;

            std::packaged_task<return_type()> task([fnc = std::forward<Fnc>(fnc), ...args = std::forward<Args>(args)]() mutable {
                return std::invoke(std::move(fnc), std::move(args)...);
            });
            auto result = task.get_future();

            if (!execute([task = std::move(task)]() mutable noexcept { task(); })) {
                throw pool_stopped("blocking_pool is stopped");
            }
            return result;
        }

        void stop() {
            std::vector<std::uint32_t> sleepers;

            const bool alreadyStopped = m_queue.with_lock([&sleepers](queue_state& queue) {
                if (queue.stopped) {
                    return true;
                }
                queue.stopped = true;
                sleepers.swap(queue.idle);
                return false;
            });

            if (!alreadyStopped) {
                for (const auto index : sleepers) {
                    m_parkingLot[index]->unpark();
                }
            }

            for (auto& thread : m_threads) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        }

        [[nodiscard]] bool is_stopped() const noexcept {
            return m_queue.with_lock([](const queue_state& queue) { return queue.stopped; });
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_threads.size(); }

        [[nodiscard]] std::size_t pending() const noexcept {
            return m_queue.with_lock([](const queue_state& queue) { return queue.jobs.size(); });
        }
    private:
        struct queue_state {
            std::deque<job_type> jobs;
            std::vector<std::uint32_t> idle;
            bool stopped = false;
        };

        void worker(const std::uint32_t index) {
            DEBUG_ASSERT(index < m_parkingLot.size());

            for (;;) {
                job_type job;
                bool exit = false;

                m_queue.with_lock([&](queue_state& queue) {
                    if (!queue.jobs.empty()) {
                        job = std::move(queue.jobs.front());
                        queue.jobs.pop_front();
                    }
                    else if (queue.stopped) {
                        exit = true;
                    }
                    else {
                        // capacity was reserved for every worker, this never allocates
                        queue.idle.push_back(index);
                    }
                });

                if (job) {
                    job();
                    continue;
                }

                if (exit) {
                    return;
                }

                // exactly one unpark() follows every idle registration
                m_parkingLot[index]->park();
            }
        }

        guard<queue_state, spinlock<spinlock_wait_mode::backoff_spin>> m_queue;
        std::vector<std::unique_ptr<thread_parker>> m_parkingLot;
        std::vector<worker_thread> m_threads;
    };
}
