#pragma once
#include <chrono>
#include <semaphore>

namespace tether {
    /**
    * @brief Blocks an idle thread until another thread hands it new work.
    *
    * Event loops park here when their ready queue is empty and no timer is due, pool
    * workers park here when the job queue is empty. The token is binary: callers must
    * pair every unpark() with exactly one park, which the loop and the pool guarantee by
    * publishing an "is parked" flag under their queue lock.
    */
    class thread_parker {
    public:
        thread_parker()
            :
            m_token(0)
        {}

        thread_parker(const thread_parker&) = delete;
        thread_parker& operator=(const thread_parker&) = delete;

        /**
        * @brief Parks the calling thread until a token is available.
        *
        * `unpark()` followed by `park()` guarantees that this call returns immediately.
        * `unpark()` synchronizes-with this `park()`.
        *
        * @throws std::system_error if the underlying token operation fails.
        */
        void park() {
            if (m_token.try_acquire()) {
                return;
            }
            m_token.acquire();
        }

        /**
        * @brief Parks the calling thread until a token is available or the time point is reached.
        *
        * @return `true` if a token was acquired, `false` on timeout.
        */
        template<class Clock, class Duration>
        requires std::chrono::is_clock_v<Clock>
        [[nodiscard]] bool park_until(const std::chrono::time_point<Clock, Duration>& timepoint) {
            if (m_token.try_acquire()) {
                return true;
            }
            return m_token.try_acquire_until(timepoint);
        }

        // Makes the token available and wakes the parked thread, if any.
        void unpark() {
            m_token.release();
        }
    private:
        std::binary_semaphore m_token;
    };
}
