#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../runtime/loop/event_loop.h"
#include "../background.h"
#include "../run_to_completion.h"

using namespace tether;
using namespace std::chrono_literals;

namespace {
    struct custom_error : std::runtime_error {
        explicit custom_error(int code)
            :
            std::runtime_error("custom error"),
            code(code)
        {}

        int code;
    };

    task<int> increment_later(int x) {
        co_await sleep_for(1ms);
        co_return x + 1;
    }

    task<std::thread::id> where_am_i() {
        co_await yield();
        co_return std::this_thread::get_id();
    }

    task<> forever() {
        co_await sleep_for(std::chrono::hours(1));
    }
}

TEST_CASE("with no loop running the work runs inline on a fresh loop", "[run_to_completion]") {
    REQUIRE(event_loop::ambient() == ambient_state::none);

    REQUIRE(run_to_completion(increment_later(41)) == 42);
    REQUIRE(run_to_completion(where_am_i()) == std::this_thread::get_id());

    REQUIRE(event_loop::ambient() == ambient_state::none);
}

TEST_CASE("errors are rethrown unmodified", "[run_to_completion]") {
    int code = 0;
    try {
        run_to_completion([]() -> task<> {
            co_await yield();
            throw custom_error(17);
        }());
    }
    catch (const custom_error& e) {
        code = e.code;
    }
    REQUIRE(code == 17);
}

TEST_CASE("a nested call from a running loop is isolated on another thread", "[run_to_completion]") {
    const auto callerThread = std::this_thread::get_id();
    std::thread::id nestedThread;

    const int value = run_to_completion([&]() -> task<int> {
        REQUIRE(event_loop::ambient() == ambient_state::running);

        // a synchronous call from scheduled code; would deadlock if it reused this loop
        nestedThread = run_to_completion(where_am_i());
        const int nested = run_to_completion(increment_later(1));

        REQUIRE(event_loop::ambient() == ambient_state::running);
        co_return nested;
    }());

    REQUIRE(value == 2);
    REQUIRE(nestedThread != callerThread);
    REQUIRE(event_loop::ambient() == ambient_state::none);
}

TEST_CASE("errors from an isolated run are rethrown on the calling thread", "[run_to_completion]") {
    bool caught = false;

    run_to_completion([&]() -> task<> {
        try {
            run_to_completion([]() -> task<> {
                throw std::length_error("too long");
                co_return;
            }());
        }
        catch (const std::length_error& e) {
            caught = std::string(e.what()) == "too long";
        }
        co_return;
    }());

    REQUIRE(caught);
}

TEST_CASE("nesting works at any depth", "[run_to_completion]") {
    std::vector<std::thread::id> threads;

    run_to_completion([&]() -> task<> {
        threads.push_back(std::this_thread::get_id());
        run_to_completion([&]() -> task<> {
            threads.push_back(std::this_thread::get_id());
            run_to_completion([&]() -> task<> {
                threads.push_back(std::this_thread::get_id());
                co_return;
            }());
            co_return;
        }());
        co_return;
    }());

    REQUIRE(threads.size() == 3);
    REQUIRE(threads[0] != threads[1]);
    REQUIRE(threads[1] != threads[2]);
}

TEST_CASE("background tasks left unfinished are cancelled when the work's loop closes", "[run_to_completion]") {
    task_registry registry;
    task_handle<> handle;

    run_to_completion([&]() -> task<> {
        handle = submit_background(registry, forever());
        co_await yield();
    }());

    REQUIRE(handle.cancelled());
    REQUIRE(registry.empty());
}

TEST_CASE("independent threads can bridge at the same time", "[run_to_completion]") {
    constexpr int numThreads = 8;
    std::atomic<int> total{0};

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < numThreads; i++) {
            threads.emplace_back([&total, i] {
                total += run_to_completion(increment_later(i));
            });
        }
    }

    REQUIRE(total.load() == (0 + 7) * 8 / 2 + numThreads);
}
