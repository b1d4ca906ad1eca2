#pragma once
#include <atomic>

#include "../backoff/backoff.h"

namespace tether {
    enum class spinlock_wait_mode {
        busy_wait,
        backoff_spin,
    };

    /**
    * @brief A lightweight spinlock for short critical sections.
    *
    * Guards the ready queue of an event loop and the job queue of the blocking pool, where
    * the lock is held only long enough to push or pop a handle.
    *
    * @tparam WaitMode Defines the waiting strategy:
    *   - @c spinlock_wait_mode::busy_wait: continuously retries until acquired.
    *   - @c spinlock_wait_mode::backoff_spin: retries with an exponential backoff strategy.
    */
    template<spinlock_wait_mode WaitMode = spinlock_wait_mode::busy_wait>
    class spinlock {
    public:
        /**
        * @brief Acquires the lock, spinning until it becomes available.
        */
        void lock() noexcept {
            backoff waiter;
            for (;;) {
                if (!m_lock.exchange(true, std::memory_order_acquire)) {
                    return;
                }

                while (m_lock.load(std::memory_order_relaxed)) {
                    if constexpr (WaitMode == spinlock_wait_mode::busy_wait) {
                        details::cpu_relax();
                    }
                    else {
                        waiter.snooze();
                    }
                }
            }
        }

        /**
        * @brief Attempts to acquire the lock without blocking.
        *
        * @return @c true if the lock was acquired, @c false if it is held by another thread.
        */
        [[nodiscard]] bool try_lock() noexcept {
            return !m_lock.load(std::memory_order_relaxed) && !m_lock.exchange(true, std::memory_order_acquire);
        }

        void unlock() noexcept {
            m_lock.store(false, std::memory_order_release);
        }

    private:
        std::atomic_bool m_lock = {false};
    };
}
