#pragma once
#include <concepts>
#include <coroutine>
#include <functional>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>
#include <libassert/assert.hpp>

#include "../runtime/coro/result_slot.h"
#include "../runtime/errors.h"
#include "../runtime/loop/event_loop.h"
#include "../runtime/scheduler/blocking_pool.h"

namespace tether {
    namespace details {
        template<class R>
        struct offload_slot {
            result_slot<R> result;
            std::shared_ptr<loop_core> loop;
            std::coroutine_handle<> continuation;
        };

        /**
        * @brief Awaitable that runs a callable on a blocking_pool worker.
        *
        * The awaiting task suspends and its loop keeps running other work. When the callable
        * returns, the task is posted back to the loop it suspended on and resumes there with the
        * callable's value or its exception. If that loop closed in the meantime the result is
        * discarded: the slot is shared, so the worker never touches a destroyed frame.
        */
        template<class R, class Fn>
        class blocking_call {
        public:
            blocking_call(blocking_pool& pool, Fn fn)
                :
                m_pool(pool),
                m_fn(std::move(fn)),
                m_slot(std::make_shared<offload_slot<R>>())
            {}

            static constexpr bool await_ready() noexcept { return false; }

            void await_suspend(std::coroutine_handle<> handle) {
                m_slot->loop = current_loop().core();
                m_slot->continuation = handle;

                auto job = [slot = m_slot, fn = std::move(m_fn)]() mutable noexcept {
                    try {
                        if constexpr (std::is_void_v<R>) {
                            std::invoke(std::move(fn));
                            slot->result.set_value();
                        }
                        else {
                            slot->result.set_value(std::invoke(std::move(fn)));
                        }
                    }
                    catch (...) {
                        slot->result.set_exception(std::current_exception());
                    }

                    [[maybe_unused]] const bool posted = slot->loop->post(slot->continuation);
                };

                if (!m_pool.execute(std::move(job))) {
                    throw pool_stopped("blocking_pool is stopped");
                }
            }

            R await_resume() {
                return std::move(m_slot->result).get();
            }
        private:
            blocking_pool& m_pool;
            Fn m_fn;
            std::shared_ptr<offload_slot<R>> m_slot;
        };

        template<class Fn, class... Args>
        auto bind_call(Fn&& fn, Args&&... args) {
            return [fn = std::forward<Fn>(fn), ...args = std::forward<Args>(args)]() mutable -> decltype(auto) {
                return std::invoke(std::move(fn), std::move(args)...);
            };
        }
    }

    /**
    * @brief Awaitable running fn(args...) on @p pool without blocking the awaiting loop.
    *
    * The arguments are decay-copied into the job. Errors raised by the callable surface at the
    * await point unchanged; pool_stopped is raised there if the pool no longer accepts work.
    */
    template<class Fn, class... Args>
    requires std::invocable<std::decay_t<Fn>, std::decay_t<Args>...>
    [[nodiscard]] auto run_blocking_on(blocking_pool& pool, Fn&& fn, Args&&... args) {
        using return_type = std::invoke_result_t<std::decay_t<Fn>, std::decay_t<Args>...>;
        static_assert(!std::is_reference_v<return_type>, "run_blocking cannot return a reference across threads");

        auto call = details::bind_call(std::forward<Fn>(fn), std::forward<Args>(args)...);
        return details::blocking_call<return_type, decltype(call)>(pool, std::move(call));
    }

    // Offloads fn(args...) to the process-wide blocking_pool.
    template<class Fn, class... Args>
    requires std::invocable<std::decay_t<Fn>, std::decay_t<Args>...>
    [[nodiscard]] auto run_blocking(Fn&& fn, Args&&... args) {
        return run_blocking_on(blocking_pool::global(), std::forward<Fn>(fn), std::forward<Args>(args)...);
    }
}
