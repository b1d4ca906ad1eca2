#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tether {
    /**
    * @brief One-shot event that threads outside any loop block on until a task finishes.
    *
    * Once set it stays set; every current and future wait returns immediately.
    */
    class completion_event {
    public:
        completion_event() = default;
        completion_event(const completion_event&) = delete;
        completion_event& operator=(const completion_event&) = delete;

        void set() {
            {
                std::lock_guard lock(m_mutex);
                m_set = true;
            }
            m_condition.notify_all();
        }

        [[nodiscard]] bool is_set() const {
            std::lock_guard lock(m_mutex);
            return m_set;
        }

        void wait() const {
            std::unique_lock lock(m_mutex);
            m_condition.wait(lock, [this] { return m_set; });
        }

        // @return @c false if the deadline passed first.
        template<class Clock, class Duration>
        [[nodiscard]] bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const {
            std::unique_lock lock(m_mutex);
            return m_condition.wait_until(lock, deadline, [this] { return m_set; });
        }

        template<class Rep, class Period>
        [[nodiscard]] bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
            return wait_until(std::chrono::steady_clock::now() + timeout);
        }
    private:
        mutable std::mutex m_mutex;
        mutable std::condition_variable m_condition;
        bool m_set = false;
    };
}
