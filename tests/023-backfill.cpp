// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "test-utils.h"
#include "model/backfill_policy.h"
#include "model/missing_data.h"
#include "model/misc/error_code.h"

using namespace syncsched;
using namespace syncsched::model;
namespace st = syncsched::test;

static gr::date d(int day) { return gr::date(2024, 1, day); }

TEST_CASE("backfill policy", "[backfill]") {
    auto policy = backfill_policy_t();
    CHECK(policy.get_threshold() == 3);
    auto today = d(10);

    SECTION("no gaps") {
        auto shape = policy.decide({}, today);
        CHECK(shape.decision == decision_t::incremental);
        CHECK(shape.kind == task_kind_t::incremental);
        CHECK(shape.partitions == partitions_t{partition_t(today)});
        CHECK(shape.missing_count == 0);
    }

    SECTION("small gap is healed") {
        auto shape = policy.decide({d(8), d(5)}, today);
        CHECK(shape.decision == decision_t::backfill);
        CHECK(shape.kind == task_kind_t::backfill);
        CHECK(shape.partitions == partitions_t{partition_t(d(5)), partition_t(d(8)), partition_t(today)});
        CHECK(shape.missing_count == 2);
    }

    SECTION("exactly at the threshold") {
        auto shape = policy.decide({d(4), d(5), d(8)}, today);
        CHECK(shape.decision == decision_t::backfill);
        CHECK(shape.partitions.size() == 4);
    }

    SECTION("today among missing dates is not duplicated") {
        auto shape = policy.decide({d(9), d(10)}, today);
        CHECK(shape.partitions == partitions_t{partition_t(d(9)), partition_t(today)});
    }

    SECTION("large gap is refused") {
        auto shape = policy.decide({d(3), d(4), d(5), d(8)}, today);
        CHECK(shape.decision == decision_t::skip_alert);
        CHECK(shape.partitions.empty());
        CHECK(shape.missing_count == 4);
        CHECK(to_string(shape.decision) == "skip_alert");
    }

    SECTION("custom threshold") {
        auto strict = backfill_policy_t(0);
        CHECK(strict.decide({d(9)}, today).decision == decision_t::skip_alert);
        CHECK(strict.decide({}, today).decision == decision_t::incremental);
    }
}

TEST_CASE("missing data detection", "[backfill]") {
    auto calendar = st::make_calendar(d(1), d(31));
    auto registry = registry_ptr_t(new registry_t());

    auto add = [&](unit_info_t info) {
        auto data = st::data_set_ptr_t(new st::data_set_t());
        REQUIRE(registry->register_unit(st::make_unit(std::move(info), data)));
        return data;
    };
    auto full = add(unit_info_t{"daily_bars"});
    auto gappy = add(unit_info_t{"adj_factor"});
    auto empty = add(unit_info_t{"moneyflow"});
    auto weekly = add(unit_info_t{"fund_nav", {}, {}, cadence_t::weekly});
    auto disabled = add(unit_info_t{"margin", {}, {}, cadence_t::daily, 120, false});

    for (auto day : {3, 4, 5, 8, 9}) {
        full->put(d(day));
    }
    gappy->put(d(3));
    gappy->put(d(8));

    auto now = st::make_time("20240110", 16);
    auto report_opt = detect_missing(*calendar, *registry, 5, d(9), now);
    REQUIRE(report_opt);
    auto &report = report_opt.value();

    CHECK(report.checked_at == now);
    CHECK(report.window_start == d(3));
    CHECK(report.window_end == d(9));
    CHECK(report.units_checked() == 3);
    CHECK(report.units_with_gaps() == 2);
    CHECK(report.total_missing() == 8);

    REQUIRE(report.find("daily_bars"));
    CHECK(report.find("daily_bars")->empty());
    CHECK(*report.find("adj_factor") == dates_t{d(4), d(5), d(9)});
    CHECK(report.find("moneyflow")->size() == 5);
    CHECK(!report.find("fund_nav"));
    CHECK(!report.find("margin"));

    CHECK(report.units[1].latest == d(8));
    CHECK(report.units[2].latest.is_not_a_date());
    CHECK(report.needs_attention(3) == missing_report_t::names_t{"moneyflow"});
    CHECK(report.needs_attention(2) == missing_report_t::names_t{"adj_factor", "moneyflow"});

    SECTION("window outside of the calendar") {
        auto r = detect_missing(*calendar, *registry, 5, gr::date(2024, 3, 1), now);
        REQUIRE(!r);
        CHECK(r.assume_error() == make_error_code(error_code_t::calendar_unavailable));
    }
}

int _init() {
    st::init_logging();
    return 1;
}

static int v = _init();
