#pragma once
#include <algorithm>
#include <cstdint>
#include <thread>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386) || defined(_M_IX86)
#include <immintrin.h>
#endif

namespace tether {
    namespace details {
        inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386) || defined(_M_IX86)
            _mm_pause();
#elif defined(__aarch64__) || defined(_M_ARM64)
            asm volatile("yield");
#elif defined(__arm__) || defined(_M_ARM)
            asm volatile("yield");
#endif
        }
    }

    /**
    * @brief Exponential spin-then-yield policy for threads waiting on work.
    *
    * Each step spins twice as long as the previous one. Once the step count passes the spin
    * limit, snooze() yields the thread instead and is_completed() reports that the caller should
    * stop spinning and block (event loops and pool workers park at that point).
    */
    class backoff {
    public:
        static constexpr std::uint32_t default_spin_limit = 6;

        backoff() noexcept = default;
        explicit backoff(const std::uint32_t spinLimit) noexcept : m_spinLimit(std::min(spinLimit, max_spin_limit)) {}

        void reset() noexcept { m_step = 0; }

        void spin() noexcept {
            const std::uint32_t iterations = 1u << std::min(m_step, m_spinLimit);

            for (std::uint32_t i = 0; i < iterations; i++) {
                details::cpu_relax();
            }

            if (m_step <= m_spinLimit) {
                m_step++;
            }
        }

        void snooze() noexcept {
            if (m_step <= m_spinLimit) {
                const std::uint32_t iterations = 1u << m_step;

                for (std::uint32_t i = 0; i < iterations; i++) {
                    details::cpu_relax();
                }
            }
            else {
                std::this_thread::yield();
            }

            if (m_step <= m_spinLimit) {
                m_step++;
            }
        }

        [[nodiscard]] bool is_completed() const noexcept { return m_step > m_spinLimit; }
        [[nodiscard]] std::uint32_t spin_limit() const noexcept { return m_spinLimit; }
    private:
        static constexpr std::uint32_t max_spin_limit = 16;

        std::uint32_t m_spinLimit = default_spin_limit;
        std::uint32_t m_step = 0;
    };
}
