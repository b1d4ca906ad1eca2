#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>
#include <type_traits>

#include "../config.h"

using namespace tether;

namespace {
    // Sets an environment variable for the lifetime of the object.
    class scoped_env {
    public:
        scoped_env(const char* name, const char* value)
            :
            m_name(name)
        {
#if defined(_WIN32)
            _putenv_s(name, value);
#else
            setenv(name, value, 1);
#endif
        }

        scoped_env(const scoped_env&) = delete;
        scoped_env& operator=(const scoped_env&) = delete;

        ~scoped_env() {
#if defined(_WIN32)
            _putenv_s(m_name.c_str(), "");
#else
            unsetenv(m_name.c_str());
#endif
        }
    private:
        std::string m_name;
    };
}

TEST_CASE("log levels round-trip through their names", "[config]") {
    REQUIRE(parse_log_level("trace") == log_level::trace);
    REQUIRE(parse_log_level("warn") == log_level::warn);
    REQUIRE(parse_log_level("off") == log_level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("WARN").has_value());
    STATIC_REQUIRE(to_string(log_level::error) == "error");
}

TEST_CASE("counts parse only within their range", "[config]") {
    REQUIRE(details::parse_count("8", 1, 256) == 8u);
    REQUIRE(details::parse_count("256", 1, 256) == 256u);
    REQUIRE_FALSE(details::parse_count("0", 1, 256).has_value());
    REQUIRE_FALSE(details::parse_count("257", 1, 256).has_value());
    REQUIRE_FALSE(details::parse_count("", 1, 256).has_value());
    REQUIRE_FALSE(details::parse_count("12abc", 1, 256).has_value());
    REQUIRE_FALSE(details::parse_count("-3", 1, 256).has_value());
}

TEST_CASE("defaults", "[config]") {
    const runtime_config config;
    REQUIRE(config.blocking_threads >= 1);
    REQUIRE(config.blocking_threads <= runtime_config::max_blocking_threads);
    REQUIRE(config.idle_spin_limit == 6);
    REQUIRE(config.level == log_level::warn);
    REQUIRE(config.thread_name_prefix == "tether");
}

TEST_CASE("environment variables override the defaults", "[config]") {
    const scoped_env threads("TETHER_BLOCKING_THREADS", "3");
    const scoped_env spin("TETHER_IDLE_SPIN_LIMIT", "0");
    const scoped_env level("TETHER_LOG_LEVEL", "debug");

    const auto config = runtime_config::from_environment();
    REQUIRE(config.blocking_threads == 3);
    REQUIRE(config.idle_spin_limit == 0);
    REQUIRE(config.level == log_level::debug);
}

TEST_CASE("malformed environment values keep the defaults", "[config]") {
    const scoped_env threads("TETHER_BLOCKING_THREADS", "lots");
    const scoped_env spin("TETHER_IDLE_SPIN_LIMIT", "17");
    const scoped_env level("TETHER_LOG_LEVEL", "chatty");

    const auto config = runtime_config::from_environment();
    const runtime_config defaults;
    REQUIRE(config.blocking_threads == defaults.blocking_threads);
    REQUIRE(config.idle_spin_limit == defaults.idle_spin_limit);
    REQUIRE(config.level == defaults.level);
}

TEST_CASE("version macros agree", "[config]") {
    const auto version = std::to_string(TETHER_VERSION_MAJOR) + "." + std::to_string(TETHER_VERSION_MINOR) + "." +
                         std::to_string(TETHER_VERSION_PATCH);
    REQUIRE(version == TETHER_VERSION_STRING);
}

TEST_CASE("the process configuration is one read-only instance", "[config]") {
    STATIC_REQUIRE(std::is_same_v<decltype(config()), const runtime_config&>);
    REQUIRE(&config() == &config());
    REQUIRE(config().blocking_threads >= 1);
}
