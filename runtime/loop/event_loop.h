#pragma once
#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>
#include <libassert/assert.hpp>

#include "../../backoff/backoff.h"
#include "../../config/config.h"
#include "../../log/log.h"
#include "../../parker/thread_parker.h"
#include "../../sync/guard.h"
#include "../../sync/spinlock.h"
#include "../coro/detached.h"
#include "../coro/result_slot.h"
#include "../coro/task.h"
#include "../errors.h"

namespace tether {
    enum class ambient_state : std::uint8_t {
        none,
        running,
    };

    namespace details {
        // Work started on a loop that has to be torn down if the loop closes before it finishes.
        class bound_task {
        public:
            virtual ~bound_task() = default;
            virtual void abandon() noexcept = 0;
        };

        /**
        * @brief Queues and timers of one event_loop.
        *
        * post() is the only operation callable from any thread. Everything else runs on the
        * thread that drives the loop. The core is shared so that work finishing on other threads
        * (blocking calls, background tasks awaited across loops) can still post to it safely
        * after the owning event_loop is gone: posts to a closed core are dropped.
        */
        class loop_core {
        public:
            using clock = std::chrono::steady_clock;

            loop_core() = default;
            loop_core(const loop_core&) = delete;
            loop_core& operator=(const loop_core&) = delete;

            /**
            * @brief Makes a suspended coroutine ready to run on this loop. Thread-safe.
            *
            * @return @c false if the loop is closed; the handle is then neither resumed nor destroyed.
            */
            bool post(std::coroutine_handle<> handle) {
                DEBUG_ASSERT(handle != nullptr);

                bool wake = false;
                const bool accepted = m_ready.with_lock([&](ready_state& ready) {
                    if (ready.closed) {
                        return false;
                    }
                    ready.handles.push_back(handle);
                    wake = std::exchange(ready.parked, false);
                    return true;
                });

                if (wake) {
                    m_parker.unpark();
                }
                return accepted;
            }

            void add_timer(const clock::time_point deadline, std::coroutine_handle<> handle) {
                m_timers.push(timer{deadline, m_timerSequence++, handle});
            }

            void bind(bound_task* task) {
                DEBUG_ASSERT(task != nullptr);
                m_bound.insert(task);
            }

            void unbind(bound_task* task) noexcept {
                m_bound.erase(task);
            }

            [[nodiscard]] std::size_t bound_count() const noexcept { return m_bound.size(); }

            [[nodiscard]] bool is_closed() const noexcept {
                return m_ready.with_lock([](const ready_state& ready) { return ready.closed; });
            }

            /**
            * @brief One scheduling step: resumes every handle that was ready when the step began.
            *
            * Handles posted while the step runs wait for the next step, so a task that yields
            * lets all other ready work run before it continues.
            *
            * @return @c false if there was nothing to run.
            */
            bool run_once() {
                DEBUG_ASSERT(m_batch.empty());

                m_ready.with_lock([this](ready_state& ready) { m_batch.swap(ready.handles); });

                const auto now = clock::now();
                while (!m_timers.empty() && m_timers.top().deadline <= now) {
                    m_batch.push_back(m_timers.top().handle);
                    m_timers.pop();
                }

                if (m_batch.empty()) {
                    return false;
                }

                while (!m_batch.empty()) {
                    const auto handle = m_batch.front();
                    m_batch.pop_front();
                    handle.resume();
                }
                return true;
            }

            // Parks the loop thread until a post() arrives or the earliest timer is due.
            void wait_for_work() {
                std::optional<clock::time_point> deadline;
                if (!m_timers.empty()) {
                    deadline = m_timers.top().deadline;
                }

                const bool mustPark = m_ready.with_lock([](ready_state& ready) {
                    if (!ready.handles.empty() || ready.closed) {
                        return false;
                    }
                    ready.parked = true;
                    return true;
                });

                if (!mustPark) {
                    return;
                }

                if (!deadline) {
                    m_parker.park();
                    return;
                }

                if (m_parker.park_until(deadline.value())) {
                    return;
                }

                // Timed out. If a producer already cleared the flag, its unpark() is in flight and
                // has to be consumed here, or the next park would return spuriously.
                const bool unparkInFlight = m_ready.with_lock([](ready_state& ready) {
                    return !std::exchange(ready.parked, false);
                });

                if (unparkInFlight) {
                    m_parker.park();
                }
            }

            /**
            * @brief Refuses further posts, cancels unfinished bound work and drops queued handles.
            *
            * Dropped handles are not resumed: they belong to frames that the cancelled work
            * destroys, or to frames owned by callers that are no longer waiting on this loop.
            */
            void close() noexcept {
                const bool wasClosed = m_ready.with_lock([](ready_state& ready) {
                    return std::exchange(ready.closed, true);
                });

                if (wasClosed) {
                    return;
                }

                auto bound = std::exchange(m_bound, {});
                if (!bound.empty()) {
                    logger::debug("closing event_loop with ", bound.size(), " unfinished background tasks, cancelling them");
                }

                for (auto* task : bound) {
                    task->abandon();
                }

                m_ready.with_lock([](ready_state& ready) { ready.handles.clear(); });
                m_batch.clear();
                m_timers = {};
            }
        private:
            struct ready_state {
                std::deque<std::coroutine_handle<>> handles;
                bool parked = false;
                bool closed = false;
            };

            struct timer {
                clock::time_point deadline;
                std::uint64_t sequence;
                std::coroutine_handle<> handle;

                friend bool operator>(const timer& lhs, const timer& rhs) noexcept {
                    return std::tie(lhs.deadline, lhs.sequence) > std::tie(rhs.deadline, rhs.sequence);
                }
            };

            guard<ready_state, spinlock<spinlock_wait_mode::backoff_spin>> m_ready;
            thread_parker m_parker;

            std::deque<std::coroutine_handle<>> m_batch;
            std::priority_queue<timer, std::vector<timer>, std::greater<>> m_timers;
            std::uint64_t m_timerSequence = 0;
            std::unordered_set<bound_task*> m_bound;
        };
    }

    /**
    * @brief Cooperative single-threaded scheduler.
    *
    * run_until_complete() binds the loop to the calling thread and interleaves every coroutine
    * scheduled on it, switching only at suspension points, until the given task finishes. At
    * most one loop runs on a thread at a time; loops on different threads are independent.
    *
    * event_loop::current() is the explicit ambient-state query: it names the loop running on
    * the calling thread, if any.
    */
    class event_loop {
    public:
        using clock = details::loop_core::clock;

        event_loop()
            :
            m_core(std::make_shared<details::loop_core>())
        {
            // Closing logs and reads the configuration. Building both statics here makes them
            // outlive loops that live in static storage themselves.
            static_cast<void>(config());
            static_cast<void>(logger::details::instance());
        }

        event_loop(const event_loop&) = delete;
        event_loop& operator=(const event_loop&) = delete;

        ~event_loop() { m_core->close(); }

        [[nodiscard]] static event_loop* current() noexcept { return m_current; }

        [[nodiscard]] static ambient_state ambient() noexcept {
            return m_current != nullptr ? ambient_state::running : ambient_state::none;
        }

        /**
        * @brief Drives @p work, and everything scheduled on this loop meanwhile, until @p work finishes.
        *
        * Background work that is still unfinished when this returns stays on the loop and
        * continues on the next run, or is cancelled when the loop closes.
        *
        * @return The value produced by @p work; its exception is rethrown unmodified.
        * @throws loop_already_running if a loop is already running on the calling thread.
        * @throws loop_closed if the loop was closed.
        */
        template<class T>
        T run_until_complete(task<T> work) {
            if (m_current != nullptr) {
                throw loop_already_running("an event_loop is already running on this thread");
            }
            if (m_core->is_closed()) {
                throw loop_closed("event_loop is closed");
            }
            DEBUG_ASSERT(work.valid());

            result_slot<T> result;
            bool finished = false;

            const auto root = drive_root(std::move(work), result, finished).release();
            if (!m_core->post(root)) {
                root.destroy();
                throw loop_closed("event_loop is closed");
            }

            running_scope scope(*this);
            backoff idle(config().idle_spin_limit);

            while (!finished) {
                if (m_core->run_once()) {
                    idle.reset();
                    continue;
                }

                idle.snooze();
                if (idle.is_completed()) {
                    m_core->wait_for_work();
                    idle.reset();
                }
            }

            return std::move(result).get();
        }

        // Thread-safe. Throws loop_closed once the loop has been closed.
        void schedule(std::coroutine_handle<> handle) {
            if (!m_core->post(handle)) {
                throw loop_closed("event_loop is closed");
            }
        }

        // Suspends the awaiting task behind all other ready work on this loop.
        [[nodiscard]] auto sched() noexcept {
            struct awaiter {
                details::loop_core* core{nullptr};

                static constexpr bool await_ready() noexcept { return false; }
                static constexpr void await_resume() noexcept {}
                bool await_suspend(std::coroutine_handle<> handle) const {
                    return core->post(handle);
                }
            };
            return awaiter{m_core.get()};
        }

        // Suspends only the awaiting task; the loop keeps running other work meanwhile.
        template<class Rep, class Period>
        [[nodiscard]] auto sleep_for(const std::chrono::duration<Rep, Period>& duration) noexcept {
            struct awaiter {
                details::loop_core* core{nullptr};
                clock::duration duration;

                [[nodiscard]] bool await_ready() const noexcept { return duration <= clock::duration::zero(); }
                static constexpr void await_resume() noexcept {}
                void await_suspend(std::coroutine_handle<> handle) const {
                    core->add_timer(clock::now() + duration, handle);
                }
            };
            return awaiter{m_core.get(), std::chrono::ceil<clock::duration>(duration)};
        }

        /**
        * @brief Closes the loop: unfinished background tasks are cancelled, further scheduling fails.
        *
        * @throws std::logic_error if called while the loop is running.
        */
        void close() {
            if (is_running()) {
                throw std::logic_error("cannot close a running event_loop");
            }
            m_core->close();
        }

        [[nodiscard]] bool is_running() const noexcept { return m_running.load(std::memory_order_acquire); }
        [[nodiscard]] bool is_closed() const noexcept { return m_core->is_closed(); }

        // Background tasks started on this loop that have not finished yet.
        [[nodiscard]] std::size_t pending_background() const noexcept { return m_core->bound_count(); }

        [[nodiscard]] const std::shared_ptr<details::loop_core>& core() const noexcept { return m_core; }
    private:
        struct running_scope {
            explicit running_scope(event_loop& loop) noexcept
                :
                m_loop(loop)
            {
                m_current = std::addressof(loop);
                m_loop.m_running.store(true, std::memory_order_release);
            }

            running_scope(const running_scope&) = delete;
            running_scope& operator=(const running_scope&) = delete;

            ~running_scope() {
                m_loop.m_running.store(false, std::memory_order_release);
                m_current = nullptr;
            }

            event_loop& m_loop;
        };

        template<class T>
        static detached_task drive_root(task<T> work, result_slot<T>& result, bool& finished) {
            try {
                if constexpr (std::is_void_v<T>) {
                    co_await std::move(work);
                    result.set_value();
                }
                else {
                    result.set_value(co_await std::move(work));
                }
            }
            catch (...) {
                result.set_exception(std::current_exception());
            }
            finished = true;
        }

        static inline thread_local event_loop* m_current = nullptr;

        std::shared_ptr<details::loop_core> m_core;
        std::atomic<bool> m_running{false};
    };

    // The loop running on the calling thread.
    [[nodiscard]] inline event_loop& current_loop() {
        if (auto* loop = event_loop::current()) {
            return *loop;
        }
        throw no_running_loop("no event_loop is running on this thread");
    }

    [[nodiscard]] inline auto yield() {
        return current_loop().sched();
    }

    template<class Rep, class Period>
    [[nodiscard]] auto sleep_for(const std::chrono::duration<Rep, Period>& duration) {
        return current_loop().sleep_for(duration);
    }
}
