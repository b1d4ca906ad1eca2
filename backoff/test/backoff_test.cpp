#include <catch2/catch_test_macros.hpp>
#include <cstdint>

#include "../backoff.h"

using namespace tether;

TEST_CASE("backoff starts not completed", "[backoff]") {
    backoff backoff;
    REQUIRE_FALSE(backoff.is_completed());
    REQUIRE(backoff.spin_limit() == backoff::default_spin_limit);
}

TEST_CASE("spin advances the backoff like snooze does", "[backoff]") {
    backoff backoff;

    for (int i = 0; i < 10000; i++) {
        backoff.spin();
    }
    REQUIRE(backoff.is_completed());
}

TEST_CASE("snooze completes after exceeding the spin limit", "[backoff]") {
    backoff backoff;

    for (std::uint32_t i = 0; i < backoff::default_spin_limit; i++) {
        backoff.snooze();
        REQUIRE_FALSE(backoff.is_completed());
    }

    backoff.snooze();
    REQUIRE(backoff.is_completed());
}

TEST_CASE("reset returns to initial state", "[backoff]") {
    backoff backoff(2);

    for (int i = 0; i < 3; ++i) {
        backoff.snooze();
    }
    REQUIRE(backoff.is_completed());

    backoff.reset();
    REQUIRE_FALSE(backoff.is_completed());

    backoff.snooze();
    backoff.snooze();
    REQUIRE_FALSE(backoff.is_completed());
    backoff.snooze();
    REQUIRE(backoff.is_completed());
}

TEST_CASE("a zero spin limit completes on the first snooze", "[backoff]") {
    backoff backoff(0);
    REQUIRE_FALSE(backoff.is_completed());

    backoff.snooze();
    REQUIRE(backoff.is_completed());
}

TEST_CASE("spin limit is clamped", "[backoff]") {
    const backoff backoff(1000);
    REQUIRE(backoff.spin_limit() == 16);
}

TEST_CASE("snoozing past completion keeps it completed", "[backoff]") {
    backoff backoff(1);

    for (int i = 0; i < 50; i++) {
        backoff.snooze();
    }
    REQUIRE(backoff.is_completed());
}
