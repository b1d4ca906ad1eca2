#pragma once
#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include <libassert/assert.hpp>

#include "../log/log.h"
#include "../runtime/coro/completion_event.h"
#include "../runtime/coro/detached.h"
#include "../runtime/coro/result_slot.h"
#include "../runtime/coro/task.h"
#include "../runtime/errors.h"
#include "../runtime/loop/event_loop.h"
#include "../sync/guard.h"
#include "../sync/spinlock.h"

namespace tether {
    enum class task_status : std::uint8_t {
        pending,
        running,
        done,
        failed,
        cancelled,
    };

    [[nodiscard]] constexpr bool is_terminal(const task_status status) noexcept {
        return status == task_status::done || status == task_status::failed || status == task_status::cancelled;
    }

    [[nodiscard]] constexpr std::string_view to_string(const task_status status) noexcept {
        switch (status) {
            case task_status::pending:   return "pending";
            case task_status::running:   return "running";
            case task_status::done:      return "done";
            case task_status::failed:    return "failed";
            case task_status::cancelled: return "cancelled";
        }
        return "unknown";
    }

    class task_registry;

    template<class T>
    class task_handle;

    namespace details {
        inline std::string describe(const std::exception_ptr& exception) {
            try {
                std::rethrow_exception(exception);
            }
            catch (const std::exception& e) {
                return e.what();
            }
            catch (...) {
                return "exception of unknown type";
            }
        }

        /**
        * @brief Type-independent part of a background task's shared state.
        *
        * Tracks the status, the coroutines waiting for completion (possibly on other loops),
        * and the two memberships the task holds while unfinished: the registry entry, which is
        * the task's only required owner, and the binding to the loop that runs it.
        */
        class background_entry : public bound_task, public std::enable_shared_from_this<background_entry> {
        public:
            background_entry(task_registry& registry, std::shared_ptr<loop_core> loop) noexcept
                :
                m_registry(registry),
                m_loop(std::move(loop))
            {}

            [[nodiscard]] task_status status() const noexcept { return m_status.load(std::memory_order_acquire); }

            [[nodiscard]] const loop_core* loop() const noexcept { return m_loop.get(); }

            [[nodiscard]] bool finished() const noexcept {
                return m_waiters.with_lock([](const waiters_state& state) { return state.finished; });
            }

            // Succeeds only while the task has not started; the task then never runs.
            bool cancel() noexcept {
                auto expected = task_status::pending;
                return m_status.compare_exchange_strong(expected, task_status::cancelled, std::memory_order_acq_rel);
            }

            void wait() const { m_completed.wait(); }

            template<class Clock, class Duration>
            [[nodiscard]] bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const {
                return m_completed.wait_until(deadline);
            }

            /**
            * @brief Registers @p handle to be posted to @p loop when the task finishes.
            *
            * @return @c false if the task already finished; the caller should not suspend.
            */
            bool add_waiter(std::coroutine_handle<> handle, std::shared_ptr<loop_core> loop) {
                return m_waiters.with_lock([&](waiters_state& state) {
                    if (state.finished) {
                        return false;
                    }
                    state.waiters.push_back(waiter{handle, std::move(loop)});
                    return true;
                });
            }
        protected:
            bool try_start() noexcept {
                auto expected = task_status::pending;
                return m_status.compare_exchange_strong(expected, task_status::running, std::memory_order_acq_rel);
            }

            inline void finish(task_status outcome) noexcept;

            std::coroutine_handle<> m_frame{nullptr};
        private:
            struct waiter {
                std::coroutine_handle<> handle;
                std::shared_ptr<loop_core> loop;
            };

            struct waiters_state {
                std::vector<waiter> waiters;
                bool finished = false;
            };

            task_registry& m_registry;
            std::shared_ptr<loop_core> m_loop;
            std::atomic<task_status> m_status{task_status::pending};
            guard<waiters_state, spinlock<>> m_waiters;
            completion_event m_completed;
        };

        template<class T>
        class background_state final : public background_entry {
        public:
            background_state(task_registry& registry, std::shared_ptr<loop_core> loop, task<T> work) noexcept
                :
                background_entry(registry, std::move(loop)),
                m_work(std::move(work))
            {}

            ~background_state() override {
                if (m_result.has_exception() && !m_retrieved.load(std::memory_order_acquire)) {
                    logger::warn("background task failed and its error was never retrieved: ", describe(m_result.exception()));
                }
            }

            [[nodiscard]] const result_slot<T>& result() const noexcept { return m_result; }

            void mark_retrieved() noexcept { m_retrieved.store(true, std::memory_order_release); }

            void set_frame(std::coroutine_handle<> frame) noexcept { m_frame = frame; }

            // Runs the work on the loop it was submitted to. The frame holds a strong reference
            // to the state, so finishing never races with the registry dropping its own.
            static detached_task drive(std::shared_ptr<background_state> self) {
                if (!self->try_start()) {
                    self->m_frame = nullptr;
                    self->m_work = {};
                    self->finish(task_status::cancelled);
                    co_return;
                }

                try {
                    if constexpr (std::is_void_v<T>) {
                        co_await std::move(self->m_work);
                        self->m_result.set_value();
                    }
                    else {
                        self->m_result.set_value(co_await std::move(self->m_work));
                    }
                }
                catch (...) {
                    self->m_result.set_exception(std::current_exception());
                }

                self->m_frame = nullptr;
                self->m_work = {};
                self->finish(self->m_result.has_exception() ? task_status::failed : task_status::done);
            }

            // The loop is closing with this task unfinished: tear the frames down and report it cancelled.
            void abandon() noexcept override {
                const auto self = shared_from_this();

                const auto frame = std::exchange(m_frame, nullptr);
                if (!frame) {
                    return;
                }

                frame.destroy();
                m_work = {};
                finish(task_status::cancelled);
            }
        private:
            task<T> m_work;
            result_slot<T> m_result;
            std::atomic<bool> m_retrieved{false};
        };
    }

    /**
    * @brief Process-wide owner of in-flight background tasks.
    *
    * A background task is inserted when it is submitted and erased the moment it reaches a
    * terminal state (done, failed or cancelled), so the registry only ever holds running or
    * about-to-start work. Callers may drop their task_handle: the registry keeps the task
    * alive until it finishes. Safe to use from any number of loops and threads.
    *
    * A registry must outlive the event loops that run its tasks; global() always does.
    */
    class task_registry {
    public:
        task_registry() = default;
        task_registry(const task_registry&) = delete;
        task_registry& operator=(const task_registry&) = delete;

        ~task_registry() {
            if (const auto remaining = size(); remaining > 0) {
                logger::warn("task_registry destroyed with ", remaining, " background tasks still registered");
            }
        }

        // Never destroyed: loops that live in static storage close after every function-local
        // static is gone, and closing erases their unfinished tasks from this registry.
        [[nodiscard]] static task_registry& global() {
            static auto* globalInstance = new task_registry();
            return *globalInstance;
        }

        [[nodiscard]] std::size_t size() const {
            return m_tasks.with_read_lock([](const entry_map& tasks) { return tasks.size(); });
        }

        [[nodiscard]] bool empty() const { return size() == 0; }

        template<class T>
        [[nodiscard]] bool contains(const task_handle<T>& handle) const {
            return handle.m_state && contains(handle.m_state.get());
        }

        void insert(std::shared_ptr<details::background_entry> entry) {
            DEBUG_ASSERT(entry != nullptr);
            m_tasks.with_lock([&entry](entry_map& tasks) {
                const auto* key = entry.get();
                tasks.emplace(key, std::move(entry));
            });
        }

        // The entry is released outside the lock: it may be the last reference to the task.
        void erase(const details::background_entry* entry) noexcept {
            std::shared_ptr<details::background_entry> removed;
            m_tasks.with_lock([&](entry_map& tasks) {
                if (const auto it = tasks.find(entry); it != tasks.end()) {
                    removed = std::move(it->second);
                    tasks.erase(it);
                }
            });
        }
    private:
        using entry_map = std::unordered_map<const details::background_entry*, std::shared_ptr<details::background_entry>>;

        [[nodiscard]] bool contains(const details::background_entry* entry) const {
            return m_tasks.with_read_lock([entry](const entry_map& tasks) { return tasks.contains(entry); });
        }

        guard<entry_map> m_tasks;
    };

    void details::background_entry::finish(const task_status outcome) noexcept {
        m_status.store(outcome, std::memory_order_release);
        m_loop->unbind(this);

        const auto self = shared_from_this();
        m_registry.erase(this);

        auto waiters = m_waiters.with_lock([](waiters_state& state) {
            state.finished = true;
            return std::exchange(state.waiters, {});
        });

        for (auto& [handle, loop] : waiters) {
            // dropped if that loop has closed in the meantime
            [[maybe_unused]] const bool posted = loop->post(handle);
        }

        m_completed.set();
    }

    /**
    * @brief Caller's view of a background task.
    *
    * Copies share the same task. Discarding every handle does not affect the task.
    */
    template<class T>
    class task_handle {
    public:
        task_handle() noexcept = default;

        explicit task_handle(std::shared_ptr<details::background_state<T>> state) noexcept
            :
            m_state(std::move(state))
        {}

        [[nodiscard]] bool valid() const noexcept { return m_state != nullptr; }

        [[nodiscard]] task_status status() const noexcept {
            DEBUG_ASSERT(valid());
            return m_state->status();
        }

        [[nodiscard]] bool done() const noexcept { return is_terminal(status()); }
        [[nodiscard]] bool cancelled() const noexcept { return status() == task_status::cancelled; }

        /**
        * @brief Cancels the task if it has not started yet.
        *
        * A cancelled task never runs; it still leaves the registry on its loop's next step.
        *
        * @return @c false if the task already started or finished.
        */
        bool cancel() noexcept {
            DEBUG_ASSERT(valid());
            return m_state->cancel();
        }

        /**
        * @brief Blocks the calling thread until the task finishes.
        *
        * @throws std::logic_error when called on the thread running the task's loop.
        */
        void wait() const {
            ensure_not_on_own_loop();
            m_state->wait();
        }

        /**
        * @brief Like wait(), but gives up at @p deadline.
        *
        * @return @c true if the task finished in time.
        * @throws std::logic_error when called on the thread running the task's loop.
        */
        template<class Clock, class Duration>
        [[nodiscard]] bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const {
            ensure_not_on_own_loop();
            return m_state->wait_until(deadline);
        }

        template<class Rep, class Period>
        [[nodiscard]] bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
            return wait_until(std::chrono::steady_clock::now() + timeout);
        }

        /**
        * @brief The task's value, or its error rethrown unmodified.
        *
        * @throws invalid_task_state if the task has not finished.
        * @throws task_cancelled if the task was cancelled.
        */
        decltype(auto) get() const {
            DEBUG_ASSERT(valid());
            switch (m_state->status()) {
                case task_status::pending:
                case task_status::running:
                    throw invalid_task_state("background task has not finished");
                case task_status::cancelled:
                    throw task_cancelled("background task was cancelled");
                case task_status::done:
                case task_status::failed:
                    break;
            }

            m_state->mark_retrieved();
            return m_state->result().get();
        }

        // The error the task failed with, or nullptr if it did not fail.
        [[nodiscard]] std::exception_ptr exception() const {
            DEBUG_ASSERT(valid());
            if (!done()) {
                throw invalid_task_state("background task has not finished");
            }
            m_state->mark_retrieved();
            return m_state->result().exception();
        }

        // Suspends the awaiting task (on any loop) until this task finishes, then behaves like get().
        auto operator co_await() const {
            struct awaiter {
                std::shared_ptr<details::background_state<T>> m_state;

                [[nodiscard]] bool await_ready() const noexcept { return m_state->finished(); }

                bool await_suspend(std::coroutine_handle<> handle) {
                    return m_state->add_waiter(handle, current_loop().core());
                }

                decltype(auto) await_resume() const {
                    return task_handle{m_state}.get();
                }
            };

            DEBUG_ASSERT(valid());
            return awaiter{m_state};
        }
    private:
        friend class task_registry;

        void ensure_not_on_own_loop() const {
            DEBUG_ASSERT(valid());
            if (const auto* loop = event_loop::current(); loop != nullptr && loop->core().get() == m_state->loop()) {
                throw std::logic_error("blocking on a background task from the thread running its loop would deadlock");
            }
        }

        std::shared_ptr<details::background_state<T>> m_state;
    };

    /**
    * @brief Starts @p work on the calling thread's loop without waiting for it.
    *
    * The task is queued to run on the loop's next step and recorded in @p registry until it
    * finishes, whatever the outcome. Its error, if any, is captured by the returned handle and
    * never reaches the caller of this function.
    *
    * @throws no_running_loop if no event_loop is running on the calling thread.
    */
    template<class T>
    task_handle<T> submit_background(task_registry& registry, task<T> work) {
        auto& loop = current_loop();
        DEBUG_ASSERT(work.valid());

        const auto& core = loop.core();
        auto state = std::make_shared<details::background_state<T>>(registry, core, std::move(work));
        auto frame = details::background_state<T>::drive(state);

        core->bind(state.get());
        try {
            registry.insert(state);
            state->set_frame(frame.handle());
            if (!core->post(frame.handle())) {
                throw loop_closed("event_loop is closed");
            }
        }
        catch (...) {
            state->set_frame(nullptr);
            registry.erase(state.get());
            core->unbind(state.get());
            throw;
        }

        // the loop owns the frame from here on
        static_cast<void>(frame.release());
        return task_handle<T>{std::move(state)};
    }

    template<class T>
    task_handle<T> submit_background(task<T> work) {
        return submit_background(task_registry::global(), std::move(work));
    }
}
