#pragma once
#include <coroutine>
#include <exception>
#include <utility>

namespace tether {
    /**
    * @brief Self-destroying coroutine frame used to start work on an event loop.
    *
    * The frame starts suspended and is owned by the detached_task until release() hands the
    * handle to a loop. Once resumed it runs to the end and frees itself. Bodies must not let an
    * exception escape: the frames built on this type catch into a result_slot.
    */
    class [[nodiscard]] detached_task {
    public:
        struct promise_type final {
            detached_task get_return_object() noexcept {
                return detached_task{std::coroutine_handle<promise_type>::from_promise(*this)};
            }
            static std::suspend_always initial_suspend() noexcept { return {}; }
            static std::suspend_never final_suspend() noexcept { return {}; }
            static void return_void() noexcept {}
            static void unhandled_exception() noexcept { std::terminate(); }
        };

        explicit detached_task(std::coroutine_handle<promise_type> handle) noexcept
            :
            m_coroHandle(handle)
        {}

        detached_task(detached_task&& rhs) noexcept
            :
            m_coroHandle(std::exchange(rhs.m_coroHandle, nullptr))
        {}

        detached_task(const detached_task&) = delete;
        detached_task& operator=(const detached_task&) = delete;
        detached_task& operator=(detached_task&&) = delete;

        ~detached_task() {
            if (m_coroHandle) {
                m_coroHandle.destroy();
            }
        }

        [[nodiscard]] std::coroutine_handle<> handle() const noexcept { return m_coroHandle; }

        // Gives up ownership. The caller must resume the frame or destroy it.
        [[nodiscard]] std::coroutine_handle<> release() noexcept {
            return std::exchange(m_coroHandle, nullptr);
        }
    private:
        std::coroutine_handle<promise_type> m_coroHandle{nullptr};
    };
}
