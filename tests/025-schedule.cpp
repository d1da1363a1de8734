// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "test-utils.h"
#include "core/schedule.h"

using namespace syncsched;
using namespace syncsched::core;
namespace st = syncsched::test;

TEST_CASE("daily schedule", "[schedule]") {
    auto schedule = schedule_t(pt::hours(18));

    SECTION("later today") {
        auto next = schedule.next_fire(st::make_time("20240105", 9, 30));
        REQUIRE(next);
        CHECK(*next == st::make_time("20240105", 18));
    }
    SECTION("exactly at the fire time") {
        auto next = schedule.next_fire(st::make_time("20240105", 18));
        REQUIRE(next);
        CHECK(*next == st::make_time("20240106", 18));
    }
    SECTION("after the fire time") {
        auto next = schedule.next_fire(st::make_time("20240105", 18, 1));
        REQUIRE(next);
        CHECK(*next == st::make_time("20240106", 18));
    }
}

TEST_CASE("weekdays schedule", "[schedule]") {
    auto schedule = schedule_t(pt::hours(18), make_filter(config::frequency_t::weekdays));
    CHECK(is_weekday(gr::date(2024, 1, 5)));
    CHECK(!is_weekday(gr::date(2024, 1, 6)));
    CHECK(!is_weekday(gr::date(2024, 1, 7)));

    // friday evening
    auto next = schedule.next_fire(st::make_time("20240105", 19));
    REQUIRE(next);
    CHECK(*next == st::make_time("20240108", 18));

    // saturday
    next = schedule.next_fire(st::make_time("20240106", 10));
    REQUIRE(next);
    CHECK(*next == st::make_time("20240108", 18));

    CHECK(!make_filter(config::frequency_t::daily));
}

TEST_CASE("no acceptable day", "[schedule]") {
    auto schedule = schedule_t(pt::hours(3), [](const gr::date &) { return false; });
    CHECK(!schedule.next_fire(st::make_time("20240105", 0)));
    CHECK(schedule.get_time() == pt::hours(3));
}
