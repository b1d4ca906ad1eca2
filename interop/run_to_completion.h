#pragma once
#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <libassert/assert.hpp>

#include "../config/config.h"
#include "../log/log.h"
#include "../runtime/coro/result_slot.h"
#include "../runtime/coro/task.h"
#include "../runtime/loop/event_loop.h"
#include "../runtime/scheduler/worker_thread.h"

namespace tether {
    namespace details {
        template<class T>
        T run_on_fresh_loop(task<T> work) {
            event_loop loop;
            return loop.run_until_complete(std::move(work));
        }

        /**
        * @brief Runs @p work on a new loop on a dedicated thread and blocks until it finishes.
        *
        * The calling thread's loop is blocked for the duration, so the work must not depend on
        * anything that only that loop would drive. The thread is joined on every exit path.
        */
        template<class T>
        T run_isolated(task<T> work) {
            result_slot<T> result;

            {
                worker_thread bridge([&result, work = std::move(work)]() mutable {
                    try {
                        if constexpr (std::is_void_v<T>) {
                            run_on_fresh_loop(std::move(work));
                            result.set_value();
                        }
                        else {
                            result.set_value(run_on_fresh_loop(std::move(work)));
                        }
                    }
                    catch (...) {
                        result.set_exception(std::current_exception());
                    }
                });
                bridge.set_thread_name(config().thread_name_prefix + "_bridge");
                bridge.join();
            }

            return std::move(result).get();
        }
    }

    /**
    * @brief Runs @p work to completion from synchronous code and returns its result.
    *
    * With no loop running on the calling thread, a fresh loop is run inline and closed
    * afterwards. Otherwise the work runs on a fresh loop on a separate thread while the caller
    * blocks, so nested calls from code already running on a loop do not deadlock.
    *
    * Either way the work's exception is rethrown unmodified, and background tasks it
    * started but did not wait for are cancelled when its loop closes.
    */
    template<class T>
    T run_to_completion(task<T> work) {
        DEBUG_ASSERT(work.valid());

        if (event_loop::ambient() == ambient_state::none) {
            logger::trace("run_to_completion: running a fresh loop on the calling thread");
            return details::run_on_fresh_loop(std::move(work));
        }

        logger::debug("run_to_completion: a loop is already running on this thread, isolating the work on a new thread");
        return details::run_isolated(std::move(work));
    }
}
