#pragma once
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#define TETHER_VERSION_MAJOR 0
#define TETHER_VERSION_MINOR 1
#define TETHER_VERSION_PATCH 0
#define TETHER_VERSION_STRING "0.1.0"

namespace tether {
    enum class log_level : std::uint8_t {
        trace,
        debug,
        info,
        warn,
        error,
        off,
    };

    [[nodiscard]] constexpr std::string_view to_string(const log_level level) noexcept {
        switch (level) {
            case log_level::trace: return "trace";
            case log_level::debug: return "debug";
            case log_level::info:  return "info";
            case log_level::warn:  return "warn";
            case log_level::error: return "error";
            case log_level::off:   return "off";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr std::optional<log_level> parse_log_level(const std::string_view text) noexcept {
        for (auto level : {log_level::trace, log_level::debug, log_level::info, log_level::warn, log_level::error, log_level::off}) {
            if (to_string(level) == text) {
                return level;
            }
        }
        return std::nullopt;
    }

    namespace details {
        inline std::optional<std::uint32_t> parse_count(const std::string_view text, const std::uint32_t min, const std::uint32_t max) noexcept {
            std::uint32_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                return std::nullopt;
            }
            if (value < min || value > max) {
                return std::nullopt;
            }
            return value;
        }

        inline std::optional<std::string_view> env(const char* name) noexcept {
            if (const char* value = std::getenv(name); value != nullptr) {
                return std::string_view{value};
            }
            return std::nullopt;
        }
    }

    /**
    * @brief Process-wide tunables for the runtime.
    *
    * The blocking pool size mirrors the usual default executor sizing: enough threads to
    * overlap blocking calls, but never an unbounded number.
    */
    struct runtime_config {
        static constexpr std::uint32_t max_blocking_threads = 32;

        std::uint32_t blocking_threads = default_blocking_threads();
        std::uint32_t idle_spin_limit = 6;
        log_level level = log_level::warn;
        std::string thread_name_prefix = "tether";

        [[nodiscard]] static std::uint32_t default_blocking_threads() noexcept {
            return std::min(max_blocking_threads, std::thread::hardware_concurrency() + 4);
        }

        /**
        * @brief Builds a configuration from TETHER_* environment variables.
        *
        * Recognized variables:
        * - TETHER_BLOCKING_THREADS: worker count of the global blocking pool, 1..256.
        * - TETHER_IDLE_SPIN_LIMIT: backoff steps an idle loop spins before parking, 0..16.
        * - TETHER_LOG_LEVEL: one of trace, debug, info, warn, error, off.
        *
        * Values that do not parse or are out of range leave the default in place.
        */
        [[nodiscard]] static runtime_config from_environment() {
            runtime_config config;

            if (const auto value = details::env("TETHER_BLOCKING_THREADS")) {
                config.blocking_threads = details::parse_count(*value, 1, 256).value_or(config.blocking_threads);
            }
            if (const auto value = details::env("TETHER_IDLE_SPIN_LIMIT")) {
                config.idle_spin_limit = details::parse_count(*value, 0, 16).value_or(config.idle_spin_limit);
            }
            if (const auto value = details::env("TETHER_LOG_LEVEL")) {
                config.level = parse_log_level(*value).value_or(config.level);
            }
            return config;
        }
    };

    // Read once from the environment on first use and immutable afterwards, so every thread
    // may read it without synchronization.
    [[nodiscard]] inline const runtime_config& config() {
        static const runtime_config instance = runtime_config::from_environment();
        return instance;
    }
}
