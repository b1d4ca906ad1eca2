#pragma once
#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>
#include <libassert/assert.hpp>

#include "result_slot.h"

namespace tether {
    template<class T>
    class task_promise;

    /**
    * @brief Lazy, move-only unit of scheduled work.
    *
    * Creating a task runs nothing: the body starts when the task is awaited, and the awaiting
    * coroutine is resumed by symmetric transfer when the body finishes. Awaiting yields the
    * returned value, or rethrows the exception that escaped the body. Destroying a task that
    * has not finished destroys its frame.
    */
    template<class T = void>
    class [[nodiscard]] task {
    public:
        using promise_type = task_promise<T>;
        using value_type = T;

        task() noexcept = default;

        explicit task(std::coroutine_handle<promise_type> handle) noexcept
            :
            m_coroHandle(handle)
        {}

        task(task&& rhs) noexcept
            :
            m_coroHandle(std::exchange(rhs.m_coroHandle, nullptr))
        {}

        task& operator=(task&& rhs) noexcept {
            if (this != std::addressof(rhs)) {
                destroy();
                m_coroHandle = std::exchange(rhs.m_coroHandle, nullptr);
            }
            return *this;
        }

        task(const task&) = delete;
        task& operator=(const task&) = delete;

        ~task() { destroy(); }

        [[nodiscard]] bool valid() const noexcept { return m_coroHandle != nullptr; }
        [[nodiscard]] bool done() const noexcept { return m_coroHandle && m_coroHandle.done(); }

        auto operator co_await() & noexcept {
            struct awaiter : awaiter_base {
                decltype(auto) await_resume() {
                    DEBUG_ASSERT(this->m_coroHandle != nullptr);
                    return this->m_coroHandle.promise().result();
                }
            };
            return awaiter{{m_coroHandle}};
        }

        auto operator co_await() && noexcept {
            struct awaiter : awaiter_base {
                decltype(auto) await_resume() {
                    DEBUG_ASSERT(this->m_coroHandle != nullptr);
                    return std::move(this->m_coroHandle.promise()).result();
                }
            };
            return awaiter{{m_coroHandle}};
        }
    private:
        struct awaiter_base {
            [[nodiscard]] bool await_ready() const noexcept {
                return !m_coroHandle || m_coroHandle.done();
            }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaitingCoro) noexcept {
                m_coroHandle.promise().set_continuation(awaitingCoro);
                return m_coroHandle;
            }

            std::coroutine_handle<promise_type> m_coroHandle{nullptr};
        };

        void destroy() noexcept {
            if (m_coroHandle) {
                std::exchange(m_coroHandle, nullptr).destroy();
            }
        }

        std::coroutine_handle<promise_type> m_coroHandle{nullptr};
    };

    namespace details {
        template<class T>
        class task_promise_base {
        public:
            struct final_awaitable {
                static bool await_ready() noexcept { return false; }

                template<class Promise>
                std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> coro) noexcept {
                    return coro.promise().m_continuation;
                }

                static void await_resume() noexcept {}
            };

            static std::suspend_always initial_suspend() noexcept { return {}; }
            static final_awaitable final_suspend() noexcept { return {}; }

            void unhandled_exception() noexcept { m_result.set_exception(std::current_exception()); }

            void set_continuation(std::coroutine_handle<> continuation) noexcept { m_continuation = continuation; }
        protected:
            result_slot<T> m_result;
        private:
            std::coroutine_handle<> m_continuation = std::noop_coroutine();
        };
    }

    template<class T>
    class task_promise : public details::task_promise_base<T> {
    public:
        task<T> get_return_object() noexcept {
            return task<T>{std::coroutine_handle<task_promise>::from_promise(*this)};
        }

        template<class U = T>
        requires std::is_convertible_v<U&&, T>
        void return_value(U&& value) {
            this->m_result.set_value(std::forward<U>(value));
        }

        T& result() & { return this->m_result.get(); }
        T result() && { return std::move(this->m_result).get(); }
    };

    template<>
    class task_promise<void> : public details::task_promise_base<void> {
    public:
        task<void> get_return_object() noexcept {
            return task<void>{std::coroutine_handle<task_promise>::from_promise(*this)};
        }

        void return_void() noexcept { m_result.set_value(); }

        void result() const { m_result.get(); }
    };
}
