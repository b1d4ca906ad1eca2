#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "../config/config.h"

namespace tether::logger {
    using sink_type = std::function<void(log_level, std::string_view)>;

    namespace details {
        struct state {
            std::mutex mutex;
            std::atomic<log_level> level{config().level};
            sink_type sink;
        };

        inline state& instance() {
            static state logState;
            return logState;
        }

        inline std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const auto time = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

            std::tm tm{};
#if defined(_WIN32)
            localtime_s(&tm, &time);
#else
            localtime_r(&time, &tm);
#endif
            std::ostringstream out;
            out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
            return out.str();
        }

        inline void write(const log_level level, const std::string_view message) {
            auto& logState = instance();
            std::lock_guard lock(logState.mutex);

            if (logState.sink) {
                logState.sink(level, message);
                return;
            }

            std::clog << '[' << timestamp() << "] [" << to_string(level) << "] [" << std::this_thread::get_id() << "] "
                      << message << '\n';
        }
    }

    inline void set_level(const log_level level) noexcept {
        details::instance().level.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] inline log_level level() noexcept {
        return details::instance().level.load(std::memory_order_relaxed);
    }

    [[nodiscard]] inline bool enabled(const log_level level) noexcept {
        return level != log_level::off && level >= logger::level();
    }

    /**
    * @brief Replaces the output of the logger. An empty sink restores std::clog output.
    *
    * The sink is called with the logger lock held, one call per line.
    */
    inline void set_sink(sink_type sink) {
        auto& logState = details::instance();
        std::lock_guard lock(logState.mutex);
        logState.sink = std::move(sink);
    }

    template<class... Args>
    void log(const log_level level, Args&&... args) {
        if (!enabled(level)) {
            return;
        }

        std::ostringstream message;
        (message << ... << std::forward<Args>(args));
        details::write(level, message.str());
    }

    template<class... Args>
    void trace(Args&&... args) { log(log_level::trace, std::forward<Args>(args)...); }

    template<class... Args>
    void debug(Args&&... args) { log(log_level::debug, std::forward<Args>(args)...); }

    template<class... Args>
    void info(Args&&... args) { log(log_level::info, std::forward<Args>(args)...); }

    template<class... Args>
    void warn(Args&&... args) { log(log_level::warn, std::forward<Args>(args)...); }

    template<class... Args>
    void error(Args&&... args) { log(log_level::error, std::forward<Args>(args)...); }
}
