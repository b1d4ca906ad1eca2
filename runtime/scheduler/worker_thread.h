#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#elif defined(__linux__)
#include <pthread.h>
#endif

namespace tether {
    /**
    * @brief Owning thread that is always joined.
    *
    * Destruction and move-assignment request a stop and join, so a worker_thread can never
    * outlive the scope that created it: every exit path of its owner reclaims the thread.
    */
    class worker_thread {
    public:
        worker_thread() noexcept = default;

        template <class Fn, class... Args>
        requires (!std::is_same_v<std::remove_cvref_t<Fn>, worker_thread>)
        explicit worker_thread(Fn&& fn, Args&&... args)
            :
            m_thread(std::forward<Fn>(fn), std::forward<Args>(args)...)
        {}

        ~worker_thread() { stop_and_join(); }

        worker_thread(const worker_thread&) = delete;
        worker_thread(worker_thread&&) noexcept = default;
        worker_thread& operator=(const worker_thread&) = delete;

        worker_thread& operator=(worker_thread&& rhs) noexcept {
            if (this == std::addressof(rhs)) {
                return *this;
            }

            stop_and_join();
            m_thread = std::move(rhs.m_thread);
            return *this;
        }

        [[nodiscard]] bool joinable() const noexcept { return m_thread.joinable(); }
        void join() { m_thread.join(); }

        // Best effort: the OS may truncate the name (15 characters on Linux) or refuse it.
        void set_thread_name(const std::string_view name) noexcept {
            if (!m_thread.joinable()) {
                return;
            }
#if defined(_WIN32)
            const auto length = MultiByteToWideChar(CP_UTF8, 0, name.data(), static_cast<int>(name.size()), nullptr, 0);
            if (length > 0) {
                std::wstring wideName(length, L'\0');
                MultiByteToWideChar(CP_UTF8, 0, name.data(), static_cast<int>(name.size()), wideName.data(), length);
                [[maybe_unused]] auto result = SetThreadDescription(m_thread.native_handle(), wideName.c_str());
            }
#elif defined(__linux__)
            char truncated[16] = {};
            name.copy(truncated, sizeof(truncated) - 1);
            [[maybe_unused]] auto result = pthread_setname_np(m_thread.native_handle(), truncated);
#endif
        }
    private:
        void stop_and_join() noexcept {
            if (m_thread.joinable()) {
                m_thread.request_stop();
                m_thread.join();
            }
        }

        std::jthread m_thread;
    };
}
