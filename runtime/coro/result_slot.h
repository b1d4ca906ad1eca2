#pragma once
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>
#include <libassert/assert.hpp>

namespace tether {
    /**
    * @brief Outcome of a unit of work: nothing yet, a value, or the exception that escaped it.
    *
    * Exceptions are stored as-is and rethrown unmodified by get().
    */
    template<class T>
    class result_slot {
    public:
        static_assert(!std::is_reference_v<T>, "result_slot stores values, not references");

        [[nodiscard]] bool empty() const noexcept { return std::holds_alternative<std::monostate>(m_result); }
        [[nodiscard]] bool has_value() const noexcept { return std::holds_alternative<T>(m_result); }
        [[nodiscard]] bool has_exception() const noexcept { return std::holds_alternative<std::exception_ptr>(m_result); }

        template<class U>
        void set_value(U&& value) {
            m_result.template emplace<T>(std::forward<U>(value));
        }

        void set_exception(std::exception_ptr exception) noexcept {
            m_result.template emplace<std::exception_ptr>(std::move(exception));
        }

        [[nodiscard]] std::exception_ptr exception() const noexcept {
            if (const auto* exception = std::get_if<std::exception_ptr>(&m_result)) {
                return *exception;
            }
            return nullptr;
        }

        T& get() & {
            rethrow_if_failed();
            return std::get<T>(m_result);
        }

        const T& get() const& {
            rethrow_if_failed();
            return std::get<T>(m_result);
        }

        T get() && {
            rethrow_if_failed();
            return std::move(std::get<T>(m_result));
        }
    private:
        void rethrow_if_failed() const {
            DEBUG_ASSERT(!empty(), "result requested before the work finished");
            if (const auto* exception = std::get_if<std::exception_ptr>(&m_result)) {
                std::rethrow_exception(*exception);
            }
        }

        std::variant<std::monostate, T, std::exception_ptr> m_result;
    };

    template<>
    class result_slot<void> {
    public:
        [[nodiscard]] bool empty() const noexcept { return !m_finished; }
        [[nodiscard]] bool has_value() const noexcept { return m_finished && !m_exception; }
        [[nodiscard]] bool has_exception() const noexcept { return m_exception != nullptr; }

        void set_value() noexcept { m_finished = true; }

        void set_exception(std::exception_ptr exception) noexcept {
            m_exception = std::move(exception);
            m_finished = true;
        }

        [[nodiscard]] std::exception_ptr exception() const noexcept { return m_exception; }

        void get() const {
            DEBUG_ASSERT(!empty(), "result requested before the work finished");
            if (m_exception) {
                std::rethrow_exception(m_exception);
            }
        }
    private:
        std::exception_ptr m_exception{nullptr};
        bool m_finished{false};
    };
}
