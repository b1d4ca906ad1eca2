#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../coro/result_slot.h"
#include "../coro/task.h"
#include "../loop/event_loop.h"

using namespace tether;

namespace {
    task<int> answer() {
        co_return 42;
    }

    task<int> add_one(int x) {
        const int value = co_await answer();
        co_return value - 42 + x + 1;
    }

    task<std::unique_ptr<int>> make_boxed(int x) {
        co_return std::make_unique<int>(x);
    }

    task<> fail_with(std::string message) {
        throw std::invalid_argument(message);
        co_return;
    }

    task<> record(std::vector<int>& order, int id) {
        order.push_back(id);
        co_return;
    }

    task<> hold(std::shared_ptr<int> resource) {
        co_await yield();
        co_return;
    }
}

TEST_CASE("task is lazy: nothing runs until it is awaited", "[task]") {
    std::vector<int> order;
    auto first = record(order, 1);
    auto second = record(order, 2);
    REQUIRE(order.empty());

    event_loop loop;
    loop.run_until_complete([&]() -> task<> {
        co_await std::move(second);
        co_await std::move(first);
    }());

    REQUIRE(order == std::vector{2, 1});
}

TEST_CASE("awaiting a task yields its value", "[task]") {
    event_loop loop;
    REQUIRE(loop.run_until_complete(add_one(41)) == 42);
}

TEST_CASE("move-only results are moved out", "[task]") {
    event_loop loop;
    auto boxed = loop.run_until_complete(make_boxed(7));
    REQUIRE(boxed != nullptr);
    REQUIRE(*boxed == 7);
}

TEST_CASE("awaiting an lvalue task gives access to the stored result", "[task]") {
    event_loop loop;
    const int value = loop.run_until_complete([]() -> task<int> {
        auto work = answer();
        int& result = co_await work;
        REQUIRE(work.done());
        co_return result;
    }());
    REQUIRE(value == 42);
}

TEST_CASE("exceptions escape the awaiting coroutine unmodified", "[task]") {
    event_loop loop;

    bool caught = false;
    loop.run_until_complete([&]() -> task<> {
        try {
            co_await fail_with("bad input");
        }
        catch (const std::invalid_argument& e) {
            caught = std::string(e.what()) == "bad input";
        }
    }());

    REQUIRE(caught);
}

TEST_CASE("destroying an unstarted task destroys its frame", "[task]") {
    auto resource = std::make_shared<int>(1);
    {
        auto work = hold(resource);
        REQUIRE(work.valid());
        REQUIRE_FALSE(work.done());
        REQUIRE(resource.use_count() == 2);
    }
    REQUIRE(resource.use_count() == 1);
}

TEST_CASE("moved-from tasks are empty", "[task]") {
    auto work = answer();
    auto other = std::move(work);
    REQUIRE_FALSE(work.valid());
    REQUIRE(other.valid());

    task<int> assigned;
    assigned = std::move(other);
    REQUIRE_FALSE(other.valid());
    REQUIRE(assigned.valid());
}

TEST_CASE("result_slot stores a value or an exception", "[task]") {
    result_slot<int> slot;
    REQUIRE(slot.empty());

    slot.set_value(3);
    REQUIRE(slot.has_value());
    REQUIRE(slot.get() == 3);
    REQUIRE(slot.exception() == nullptr);

    slot.set_exception(std::make_exception_ptr(std::runtime_error("late")));
    REQUIRE(slot.has_exception());
    REQUIRE_THROWS_AS(slot.get(), std::runtime_error);

    result_slot<void> done;
    REQUIRE(done.empty());
    done.set_value();
    REQUIRE(done.has_value());
    REQUIRE_NOTHROW(done.get());
}
