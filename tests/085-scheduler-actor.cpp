// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "test-utils.h"
#include "test_supervisor.h"
#include "access.h"
#include "managed_worker.h"
#include "history_sink.h"
#include "core/engine_actor.h"
#include "core/scheduler_actor.h"
#include "core/names.h"
#include <set>

namespace r = rotor;
namespace st = syncsched::test;

using namespace syncsched;
using namespace syncsched::core;
using namespace syncsched::model;

namespace {

struct status_client_t : r::actor_base_t {
    using r::actor_base_t::actor_base_t;
    using status_res_ptr_t = r::intrusive_ptr_t<message::scheduler_status_response_t>;

    void configure(r::plugin::plugin_base_t &plugin) noexcept override {
        r::actor_base_t::configure(plugin);
        plugin.with_casted<r::plugin::registry_plugin_t>(
            [&](auto &p) { p.discover_name(names::scheduler, scheduler, true).link(false); });
        plugin.with_casted<r::plugin::starter_plugin_t>(
            [&](auto &p) { p.subscribe_actor(&status_client_t::on_status); });
    }

    void query() { request<payload::scheduler_status_request_t>(scheduler).send(init_timeout); }

    void on_status(message::scheduler_status_response_t &res) noexcept { status_res = &res; }

    r::address_ptr_t scheduler;
    status_res_ptr_t status_res;
};

struct fixture_t {
    using scheduler_ptr_t = r::intrusive_ptr_t<scheduler_actor_t>;
    using worker_ptr_t = r::intrusive_ptr_t<st::managed_worker_t>;
    using sink_ptr_t = r::intrusive_ptr_t<st::history_sink_t>;
    using client_ptr_t = r::intrusive_ptr_t<status_client_t>;
    using names_t = std::set<std::string>;

    fixture_t() noexcept {
        registry = registry_ptr_t(new registry_t());
        clock = st::manual_clock_ptr_t(new st::manual_clock_t(st::make_time("20240108", 10)));
        calendar = st::make_calendar(gr::date(2024, 1, 1), gr::date(2024, 2, 29));
        engine_config = config::engine_config_t{3, 3, 1, 1000, 0, 1, 100, 10};

        scheduler_config.enabled = true;
        scheduler_config.missing_check_time = pt::time_duration(16, 0, 0);
        scheduler_config.sync_time = pt::time_duration(18, 0, 0);
        scheduler_config.cleanup_time = pt::time_duration(3, 0, 0);
        scheduler_config.frequency = config::frequency_t::daily;
        scheduler_config.skip_non_trading_days = true;
        scheduler_config.include_optional_deps = false;
        scheduler_config.smart_backfill = false;
        scheduler_config.backfill_threshold = 3;
        scheduler_config.lookback_days = 30;
        scheduler_config.retention_days = 30;
        scheduler_config.market = "cn";
    }

    unit_ptr_t make_unit(unit_info_t info, const st::data_set_ptr_t &data) {
        auto name = info.name;
        auto fetcher = make_fetcher([this, data, name](std::string_view, const partition_t &partition) {
            if (failing.count(name)) {
                return fetch_result_t::failure("HTTP 500: upstream failure", false);
            }
            data->put(partition.key());
            return fetch_result_t::success(1);
        });
        return unit_t::create(std::move(info), fetcher, st::make_probe(data)).value();
    }

    void run() noexcept {
        auto stock_info = unit_info_t{"stock_list"};
        stock_info.full_scan = true;
        REQUIRE(registry->register_unit(make_unit(stock_info, stock)));
        REQUIRE(registry->register_unit(make_unit(unit_info_t{"daily_bars", {"stock_list"}}, bars)));
        REQUIRE(registry->register_unit(make_unit(unit_info_t{"adj_factor", {"daily_bars"}}, adj)));
        auto fund_info = unit_info_t{"fund_nav"};
        fund_info.cadence = cadence_t::weekly;
        REQUIRE(registry->register_unit(make_unit(fund_info, fund)));

        r::system_context_t ctx;
        sup = ctx.create_supervisor<st::supervisor_t>().timeout(timeout).create_registry().finish();
        sup->start();
        sink = sup->create_actor<st::history_sink_t>().timeout(timeout).finish();
        for (std::uint32_t i = 1; i <= engine_config.worker_threads; ++i) {
            auto w = sup->create_actor<st::managed_worker_t>()
                         .index(i)
                         .auto_reply(auto_reply)
                         .timeout(timeout)
                         .finish();
            workers.emplace_back(std::move(w));
        }
        sup->create_actor<engine_actor_t>()
            .registry(registry)
            .engine_config(engine_config)
            .clock(clock)
            .timeout(timeout)
            .finish();
        scheduler = sup->create_actor<scheduler_actor_t>()
                        .registry(registry)
                        .calendar(calendar)
                        .clock(clock)
                        .scheduler_config(scheduler_config)
                        .request_timeout(timeout)
                        .timeout(timeout)
                        .finish();
        client = sup->create_actor<status_client_t>().timeout(timeout).finish();
        sup->do_process();
        REQUIRE(static_cast<r::actor_base_t *>(scheduler.get())->access<st::to::state>() == r::state_t::OPERATIONAL);
        sink->watch(scheduler->get_address());
        sup->do_process();

        main();

        sup->shutdown();
        sup->do_process();
        CHECK(static_cast<r::actor_base_t *>(sup.get())->access<st::to::state>() == r::state_t::SHUT_DOWN);
    }

    virtual void main() noexcept {}

    scheduler_actor_t::jobs_t &jobs() { return scheduler->access<st::to::jobs>(); }

    void fire(scheduler_actor_t::job_t &job) {
        REQUIRE(job.timer);
        sup->do_invoke_timer(*job.timer);
        sup->do_process();
    }

    void trigger() {
        sup->send<payload::trigger_sync_t>(scheduler->get_address());
        sup->do_process();
    }

    void drain() {
        sup->do_process();
        auto again = true;
        while (again) {
            again = false;
            for (auto &w : workers) {
                again = w->process() > 0 || again;
            }
            sup->do_process();
        }
    }

    payload::scheduler_status_response_t &status() {
        client->status_res.reset();
        client->query();
        sup->do_process();
        REQUIRE(client->status_res);
        REQUIRE(!client->status_res->payload.ee);
        return client->status_res->payload.res;
    }

    std::size_t record_index(std::string_view unit) const {
        for (std::size_t i = 0; i < sink->records.size(); ++i) {
            if (sink->records[i].unit == unit) {
                return i;
            }
        }
        return sink->records.size();
    }

    r::pt::time_duration timeout = r::pt::millisec{10};
    bool auto_reply = true;
    config::engine_config_t engine_config;
    config::scheduler_config_t scheduler_config;
    registry_ptr_t registry;
    trade_calendar_ptr_t calendar;
    st::manual_clock_ptr_t clock;
    names_t failing;
    st::data_set_ptr_t stock{new st::data_set_t()};
    st::data_set_ptr_t bars{new st::data_set_t()};
    st::data_set_ptr_t adj{new st::data_set_t()};
    st::data_set_ptr_t fund{new st::data_set_t()};
    r::intrusive_ptr_t<st::supervisor_t> sup;
    sink_ptr_t sink;
    std::vector<worker_ptr_t> workers;
    scheduler_ptr_t scheduler;
    client_ptr_t client;
};

missing_report_t make_report(const pt::ptime &now) {
    auto report = missing_report_t();
    report.checked_at = now;
    report.window_start = gr::date(2023, 11, 24);
    report.window_end = gr::date(2024, 1, 5);
    auto bars_missing = dates_t{gr::date(2024, 1, 4), gr::date(2024, 1, 5)};
    auto adj_missing = dates_t{};
    for (int day = 1; day <= 5; ++day) {
        adj_missing.emplace_back(gr::date(2024, 1, day));
    }
    report.units.emplace_back(unit_gaps_t{"daily_bars", bars_missing, gr::date(2024, 1, 3)});
    report.units.emplace_back(unit_gaps_t{"adj_factor", adj_missing, gr::date()});
    return report;
}

} // namespace

void test_schedule() {
    struct F : fixture_t {
        void main() noexcept override {
            CHECK(jobs().missing_check.next == st::make_time("20240108", 16));
            CHECK(jobs().sync.next == st::make_time("20240108", 18));
            CHECK(jobs().cleanup.next == st::make_time("20240109", 3));
            CHECK(jobs().sync.timer);

            SECTION("status") {
                auto &s = status();
                CHECK(!s.running);
                CHECK(s.next_sync == st::make_time("20240108", 18));
                CHECK(s.config.lookback_days == 30);
                CHECK(!s.last_sync);
                CHECK(!s.last_missing);
            }

            SECTION("update") {
                auto cfg = scheduler_config;
                cfg.sync_time = pt::time_duration(20, 30, 0);
                sup->send<payload::update_schedule_t>(scheduler->get_address(), cfg);
                sup->do_process();
                CHECK(jobs().sync.next == st::make_time("20240108", 20, 30));
                CHECK(status().config.sync_time == pt::time_duration(20, 30, 0));
            }

            SECTION("weekdays only") {
                clock->set(st::make_time("20240112", 19));
                auto cfg = scheduler_config;
                cfg.frequency = config::frequency_t::weekdays;
                sup->send<payload::update_schedule_t>(scheduler->get_address(), cfg);
                sup->do_process();
                CHECK(jobs().sync.next == st::make_time("20240115", 18));
                CHECK(jobs().missing_check.next == st::make_time("20240115", 16));
                CHECK(jobs().cleanup.next == st::make_time("20240113", 3));
            }

            SECTION("disabled") {
                auto cfg = scheduler_config;
                cfg.enabled = false;
                sup->send<payload::update_schedule_t>(scheduler->get_address(), cfg);
                sup->do_process();
                CHECK(!jobs().sync.next);
                CHECK(!jobs().sync.timer);
                CHECK(!jobs().missing_check.timer);
                CHECK(jobs().cleanup.timer);

                trigger();
                REQUIRE(sink->sync_reports.size() == 1);
                CHECK(sink->sync_reports[0].trigger == trigger_t::manual);
            }
        }
    };
    F().run();
}

void test_sync_run() {
    struct F : fixture_t {
        void main() noexcept override {
            SECTION("timer tick runs units in dependency order") {
                clock->set(st::make_time("20240108", 18));
                fire(jobs().sync);
                REQUIRE(sink->sync_reports.size() == 1);
                auto &report = sink->sync_reports[0];
                CHECK(report.run_id == 1);
                CHECK(report.trigger == trigger_t::scheduled);
                CHECK(report.status == run_status_t::completed);
                REQUIRE(report.units.size() == 4);
                CHECK(report.units[0].unit == "stock_list");
                CHECK(report.units[1].unit == "daily_bars");
                CHECK(report.units[2].unit == "adj_factor");
                CHECK(report.units[3].unit == "fund_nav");
                CHECK(report.count(unit_outcome_t::completed) == 4);
                CHECK(report.find("daily_bars")->decision == decision_t::incremental);
                CHECK(report.find("daily_bars")->rows_written == 1);

                REQUIRE(sink->records.size() == 4);
                CHECK(record_index("stock_list") < record_index("daily_bars"));
                CHECK(record_index("daily_bars") < record_index("adj_factor"));
                CHECK(stock->has("all"));
                CHECK(bars->has("20240108"));
                CHECK(adj->has("20240108"));
                CHECK(fund->has("20240108"));

                CHECK(jobs().sync.next == st::make_time("20240109", 18));
                CHECK(status().last_sync->run_id == 1);
            }

            SECTION("non-trading day is skipped") {
                clock->set(st::make_time("20240113", 18));
                fire(jobs().sync);
                CHECK(sink->sync_reports.empty());
                CHECK(jobs().sync.next == st::make_time("20240114", 18));
            }

            SECTION("disabled unit is not planned") {
                sup->send<payload::set_unit_enabled_t>(scheduler->get_address(), std::string("fund_nav"), false);
                sup->do_process();
                trigger();
                REQUIRE(sink->sync_reports.size() == 1);
                CHECK(sink->sync_reports[0].units.size() == 3);
                CHECK(!sink->sync_reports[0].find("fund_nav"));
                CHECK(fund->empty());
            }

            SECTION("failed unit with historic data does not block its dependents") {
                bars->put("20240105");
                failing.emplace("daily_bars");
                trigger();
                REQUIRE(sink->sync_reports.size() == 1);
                auto &report = sink->sync_reports[0];
                CHECK(report.status == run_status_t::completed);
                CHECK(report.find("daily_bars")->outcome == unit_outcome_t::failed);
                auto adj_report = report.find("adj_factor");
                CHECK(adj_report->outcome == unit_outcome_t::completed);
                CHECK(adj_report->task_id);
                CHECK(record_index("daily_bars") < record_index("adj_factor"));
                CHECK(report.failed_units() == sync_report_t::names_t{"daily_bars"});
                CHECK(adj->has("20240108"));
            }

            SECTION("failed unit without data is rejected by the engine, then retry") {
                failing.emplace("daily_bars");
                trigger();
                REQUIRE(sink->sync_reports.size() == 1);
                auto &report = sink->sync_reports[0];
                CHECK(report.status == run_status_t::completed);
                auto bars_report = report.find("daily_bars");
                CHECK(bars_report->outcome == unit_outcome_t::failed);
                CHECK(bars_report->error_type == error_type_t::execution_error);
                auto adj_report = report.find("adj_factor");
                CHECK(adj_report->outcome == unit_outcome_t::skipped_dependency);
                CHECK(adj_report->error.find("daily_bars (no data)") != std::string::npos);
                CHECK(!adj_report->task_id);
                CHECK(report.find("fund_nav")->outcome == unit_outcome_t::completed);
                CHECK(report.failed_units() == sync_report_t::names_t{"daily_bars", "adj_factor"});
                CHECK(adj->empty());

                failing.clear();
                sup->send<payload::retry_failed_t>(scheduler->get_address());
                sup->do_process();
                REQUIRE(sink->sync_reports.size() == 2);
                auto &retry = sink->sync_reports[1];
                CHECK(retry.run_id == 2);
                CHECK(retry.trigger == trigger_t::manual);
                REQUIRE(retry.units.size() == 2);
                CHECK(retry.units[0].unit == "daily_bars");
                CHECK(retry.units[1].unit == "adj_factor");
                CHECK(retry.count(unit_outcome_t::completed) == 2);
                CHECK(adj->has("20240108"));

                sup->send<payload::retry_failed_t>(scheduler->get_address());
                sup->do_process();
                CHECK(sink->sync_reports.size() == 2);
            }
        }
    };
    F().run();
}

void test_in_flight() {
    struct F : fixture_t {
        F() { auto_reply = false; }

        void main() noexcept override {
            trigger();
            CHECK(workers[0]->queue.size() == 1);
            CHECK(workers[1]->queue.size() == 1);
            auto &s = status();
            REQUIRE(s.running);
            REQUIRE(s.current);
            CHECK(s.current->find("stock_list")->outcome == unit_outcome_t::submitted);
            CHECK(s.current->find("daily_bars")->outcome == unit_outcome_t::planned);

            SECTION("overlapping runs are skipped") {
                trigger();
                clock->set(st::make_time("20240108", 18));
                fire(jobs().sync);
                CHECK(jobs().sync.next == st::make_time("20240109", 18));

                drain();
                REQUIRE(sink->sync_reports.size() == 1);
                CHECK(sink->sync_reports[0].count(unit_outcome_t::completed) == 4);
                CHECK(sink->records.size() == 4);
                CHECK(!status().running);
            }

            SECTION("stop") {
                sup->send<payload::stop_sync_t>(scheduler->get_address());
                sup->do_process();
                CHECK(sink->sync_reports.empty());

                drain();
                REQUIRE(sink->sync_reports.size() == 1);
                auto &report = sink->sync_reports[0];
                CHECK(report.status == run_status_t::stopped);
                CHECK(report.count(unit_outcome_t::cancelled) == 4);
                CHECK(report.find("daily_bars")->error == "stopped");
                CHECK(!report.find("daily_bars")->task_id);
                CHECK(report.find("stock_list")->task_id);
                CHECK(report.failed_units().size() == 4);
                CHECK(bars->empty());
            }
        }
    };
    F().run();
}

void test_smart_backfill() {
    struct F : fixture_t {
        F() { scheduler_config.smart_backfill = true; }

        void main() noexcept override {
            trigger();
            REQUIRE(sink->detections.size() == 1);
            CHECK(sink->records.empty());
            CHECK(status().running);

            SECTION("plan follows the missing data report") {
                sink->reply_detection(make_report(clock->now()));
                sup->do_process();

                REQUIRE(sink->sync_reports.size() == 1);
                auto &report = sink->sync_reports[0];
                CHECK(report.status == run_status_t::completed);

                auto bars_report = report.find("daily_bars");
                CHECK(bars_report->outcome == unit_outcome_t::completed);
                CHECK(bars_report->decision == decision_t::backfill);
                CHECK(bars_report->missing_count == 2);
                CHECK(bars_report->partitions == 3);
                CHECK(bars->has("20240104"));
                CHECK(bars->has("20240105"));
                CHECK(bars->has("20240108"));

                auto adj_report = report.find("adj_factor");
                CHECK(adj_report->outcome == unit_outcome_t::skipped_alert);
                CHECK(adj_report->decision == decision_t::skip_alert);
                CHECK(adj_report->missing_count == 5);
                CHECK(adj->empty());

                CHECK(report.find("stock_list")->partitions == 1);
                CHECK(report.find("fund_nav")->decision == decision_t::incremental);
                CHECK(report.failed_units().empty());

                SECTION("fresh report is reused") {
                    trigger();
                    CHECK(sink->detections.empty());
                    CHECK(sink->sync_reports.size() == 2);
                }
            }

            SECTION("stop while waiting for the report") {
                sup->send<payload::stop_sync_t>(scheduler->get_address());
                sup->do_process();
                REQUIRE(sink->sync_reports.size() == 1);
                CHECK(sink->sync_reports[0].status == run_status_t::stopped);
                CHECK(sink->sync_reports[0].units.empty());

                sink->reply_detection(make_report(clock->now()));
                sup->do_process();
                CHECK(sink->sync_reports.size() == 1);
                CHECK(status().last_missing);
            }
        }
    };
    F().run();
}

void test_missing_check() {
    struct F : fixture_t {
        void main() noexcept override {
            clock->set(st::make_time("20240108", 16));
            fire(jobs().missing_check);
            REQUIRE(sink->detections.size() == 1);
            auto &p = sink->detections[0]->payload.request_payload;
            CHECK(p.lookback_days == 30);
            CHECK(p.market == "cn");
            CHECK(p.now == clock->now());
            CHECK(jobs().missing_check.next == st::make_time("20240109", 16));

            SECTION("tick while the check is in progress") {
                fire(jobs().missing_check);
                CHECK(sink->detections.size() == 1);
                sink->reply_detection(make_report(clock->now()));
                sup->do_process();
            }

            SECTION("report is kept") {
                sink->reply_detection(make_report(clock->now()));
                sup->do_process();
                auto &s = status();
                REQUIRE(s.last_missing);
                CHECK(s.last_missing->units_with_gaps() == 2);
                CHECK(s.last_missing->needs_attention(3) == missing_report_t::names_t{"adj_factor"});

                clock->set(st::make_time("20240113", 16));
                fire(jobs().missing_check);
                CHECK(sink->detections.empty());
            }
        }
    };
    F().run();
}

void test_housekeeping() {
    struct F : fixture_t {
        void main() noexcept override {
            clock->set(st::make_time("20240109", 3));
            fire(jobs().cleanup);
            REQUIRE(sink->cleanups.size() == 1);
            CHECK(sink->refreshes == 1);
            auto &p = sink->cleanups[0]->payload.request_payload;
            CHECK(p.retention_days == 30);
            CHECK(p.now == clock->now());
            CHECK(jobs().cleanup.next == st::make_time("20240110", 3));

            fire(jobs().cleanup);
            CHECK(sink->cleanups.size() == 1);
            CHECK(sink->refreshes == 1);

            sink->reply_cleanup(5);
            sup->do_process();
            fire(jobs().cleanup);
            CHECK(sink->cleanups.size() == 1);
            CHECK(sink->refreshes == 2);
            sink->reply_cleanup(0);
            sup->do_process();
        }
    };
    F().run();
}

int _init() {
    st::init_logging();
    REGISTER_TEST_CASE(test_schedule, "scheduler timers", "[scheduler]");
    REGISTER_TEST_CASE(test_sync_run, "scheduler sync run", "[scheduler]");
    REGISTER_TEST_CASE(test_in_flight, "scheduler in-flight run", "[scheduler]");
    REGISTER_TEST_CASE(test_smart_backfill, "scheduler smart backfill", "[scheduler]");
    REGISTER_TEST_CASE(test_missing_check, "scheduler missing data check", "[scheduler]");
    REGISTER_TEST_CASE(test_housekeeping, "scheduler housekeeping", "[scheduler]");
    return 1;
}

static int v = _init();
