#pragma once
#include <concepts>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <libassert/assert.hpp>

namespace tether {
    template <class T>
    concept MutexType = requires(T lk) {
        { lk.lock() } -> std::same_as<void>;
        { lk.unlock() } -> std::same_as<void>;
        { lk.try_lock() } -> std::convertible_to<bool>;
    };

    template <class T>
    concept SharedMutexType = MutexType<T> && requires(T lk) {
        { lk.lock_shared() } -> std::same_as<void>;
        { lk.unlock_shared() } -> std::same_as<void>;
        { lk.try_lock_shared() } -> std::convertible_to<bool>;
    };

    /**
    * @brief Pointer-like access to a guarded datum that keeps its lock held while alive.
    *
    * Movable, not copyable. Produced by guard::lock() and guard::read().
    */
    template<class Reference, class Lock, class Datum>
    class locked_ptr {
    public:
        locked_ptr(Datum* datum, Lock&& lk) noexcept(std::is_nothrow_move_constructible_v<Lock>)
            :
            m_datum{datum},
            m_lock{std::move(lk)}
        {}

        locked_ptr(locked_ptr&&) noexcept = default;
        locked_ptr& operator=(locked_ptr&&) noexcept = default;

        locked_ptr(const locked_ptr&) = delete;
        locked_ptr& operator=(const locked_ptr&) = delete;

        Reference get() const noexcept {
            DEBUG_ASSERT(m_datum != nullptr);
            return *m_datum;
        }

        Reference operator*() const noexcept {
            DEBUG_ASSERT(m_datum != nullptr);
            return *m_datum;
        }

        auto operator->() const noexcept {
            DEBUG_ASSERT(m_datum != nullptr);
            return std::addressof(*m_datum);
        }
    private:
        Datum* m_datum{};
        Lock m_lock{};
    };

    /**
    * @brief Couples a datum with the mutex that protects it.
    *
    * The datum is reachable only through a held lock: either a locked_ptr returned by
    * lock()/read(), or a callable run by with_lock()/with_read_lock(). Shared (read) access
    * is available when @c Mtx supports it.
    *
    * @tparam Datum Stored datum type.
    * @tparam Mtx Mutex type used for synchronization (defaults to \c std::shared_mutex).
    */
    template<class Datum, MutexType Mtx = std::shared_mutex>
    class guard {
    public:
        template <class... Args>
        explicit guard(std::in_place_t, Args&&... args) noexcept(std::is_nothrow_constructible_v<Datum, Args...>)
            :
            m_datum(std::forward<Args>(args)...)
        {}

        guard() = default;

        guard(const guard&) = delete;
        guard& operator=(const guard&) = delete;

        // Exclusive access for modification.
        auto lock() noexcept {
            std::unique_lock<Mtx> lk(m_mutex);
            return locked_ptr<Datum&, decltype(lk), Datum>{std::addressof(m_datum), std::move(lk)};
        }

        auto lock() const noexcept {
            std::unique_lock<Mtx> lk(m_mutex);
            return locked_ptr<const Datum&, decltype(lk), const Datum>{std::addressof(m_datum), std::move(lk)};
        }

        // Shared access for readers.
        auto read() const noexcept requires SharedMutexType<Mtx> {
            std::shared_lock<Mtx> lk(m_mutex);
            return locked_ptr<const Datum&, decltype(lk), const Datum>{std::addressof(m_datum), std::move(lk)};
        }

        template <class Callable>
        decltype(auto) with_lock(Callable&& callable) {
            auto lk = lock();
            return std::invoke(std::forward<Callable>(callable), lk.get());
        }

        template <class Callable>
        decltype(auto) with_lock(Callable&& callable) const {
            auto lk = lock();
            return std::invoke(std::forward<Callable>(callable), lk.get());
        }

        template <class Callable>
        decltype(auto) with_read_lock(Callable&& callable) const requires SharedMutexType<Mtx> {
            auto reader = read();
            return std::invoke(std::forward<Callable>(callable), reader.get());
        }
    private:
        mutable Mtx m_mutex{};
        Datum m_datum{};
    };
}
