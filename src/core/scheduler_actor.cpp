// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "scheduler_actor.h"
#include "names.h"
#include "model/misc/error_code.h"
#include "utils/time.h"
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <unordered_set>

using namespace syncsched::core;

namespace {
namespace resource {
r::plugin::resource_id_t timer = 0;
} // namespace resource

bool is_dependency_failure(const std::error_code &ec) noexcept {
    namespace m = syncsched::model;
    auto expected = std::error_code(m::make_error_code(m::error_code_t::dependency_not_satisfied));
    return ec.value() == expected.value() && std::string_view(ec.category().name()) == expected.category().name();
}

} // namespace

scheduler_actor_t::scheduler_actor_t(config_t &cfg)
    : r::actor_base_t(cfg), registry{cfg.registry}, calendar{cfg.calendar}, clock{cfg.clock},
      scheduler_config{cfg.scheduler_config}, request_timeout{cfg.request_timeout} {}

void scheduler_actor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    r::actor_base_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity(names::scheduler, false);
        log = utils::get_logger(identity);
    });
    plugin.with_casted<r::plugin::registry_plugin_t>([&](auto &p) {
        p.register_name(names::scheduler, get_address());
        p.discover_name(names::detector, detector, true).link(false);
        p.discover_name(names::history, history, true).link(false);
        p.discover_name(names::engine, engine, true).link(false).callback([&](auto phase, auto &ee) {
            if (!ee && phase == r::plugin::registry_plugin_t::phase_t::linking) {
                auto p = get_plugin(r::plugin::starter_plugin_t::class_identity);
                auto plugin = static_cast<r::plugin::starter_plugin_t *>(p);
                plugin->subscribe_actor(&scheduler_actor_t::on_task_finished, engine);
            }
        });
    });
    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &p) {
        p.subscribe_actor(&scheduler_actor_t::on_submit);
        p.subscribe_actor(&scheduler_actor_t::on_cancel);
        p.subscribe_actor(&scheduler_actor_t::on_detect);
        p.subscribe_actor(&scheduler_actor_t::on_cleanup);
        p.subscribe_actor(&scheduler_actor_t::on_update_schedule);
        p.subscribe_actor(&scheduler_actor_t::on_set_unit_enabled);
        p.subscribe_actor(&scheduler_actor_t::on_trigger_sync);
        p.subscribe_actor(&scheduler_actor_t::on_stop_sync);
        p.subscribe_actor(&scheduler_actor_t::on_retry_failed);
        p.subscribe_actor(&scheduler_actor_t::on_status);
    });
}

void scheduler_actor_t::on_start() noexcept {
    LOG_TRACE(log, "on_start");
    r::actor_base_t::on_start();
    schedule_all();
}

void scheduler_actor_t::shutdown_start() noexcept {
    LOG_TRACE(log, "shutdown_start");
    cancel_all();
    r::actor_base_t::shutdown_start();
}

void scheduler_actor_t::shutdown_finish() noexcept {
    LOG_TRACE(log, "shutdown_finish");
    r::actor_base_t::shutdown_finish();
}

void scheduler_actor_t::schedule_all() noexcept {
    if (scheduler_config.enabled) {
        auto filter = make_filter(scheduler_config.frequency);
        schedule(jobs.missing_check, scheduler_config.missing_check_time, filter,
                 &scheduler_actor_t::on_missing_check_timer, "missing data check");
        schedule(jobs.sync, scheduler_config.sync_time, filter, &scheduler_actor_t::on_sync_timer, "sync");
    } else {
        LOG_INFO(log, "scheduling is disabled, only manual sync runs are possible");
    }
    schedule(jobs.cleanup, scheduler_config.cleanup_time, {}, &scheduler_actor_t::on_cleanup_timer, "housekeeping");
}

void scheduler_actor_t::schedule(job_t &job, const pt::time_duration &at, day_filter_t filter,
                                 timer_handler_t handler, std::string_view name) noexcept {
    auto now = clock->now();
    auto next = schedule_t(at, std::move(filter)).next_fire(now);
    job.next = next;
    if (!next) {
        LOG_WARN(log, "no fire time for {} job within the look-ahead window", name);
        return;
    }
    LOG_DEBUG(log, "next {} at {}", name, pt::to_simple_string(*next));
    job.timer = start_timer(*next - now, *this, handler);
    resources->acquire(resource::timer);
}

void scheduler_actor_t::cancel(job_t &job) noexcept {
    job.next.reset();
    if (job.timer) {
        auto timer_id = *job.timer;
        job.timer.reset();
        cancel_timer(timer_id);
    }
}

void scheduler_actor_t::cancel_all() noexcept {
    cancel(jobs.missing_check);
    cancel(jobs.sync);
    cancel(jobs.cleanup);
}

bool scheduler_actor_t::release(job_t &job, r::request_id_t timer_id) noexcept {
    resources->release(resource::timer);
    if (job.timer && *job.timer == timer_id) {
        job.timer.reset();
        return true;
    }
    return false;
}

void scheduler_actor_t::on_missing_check_timer(r::request_id_t timer_id, bool cancelled) noexcept {
    if (!release(jobs.missing_check, timer_id) || cancelled) {
        return;
    }
    run_missing_check();
    schedule(jobs.missing_check, scheduler_config.missing_check_time, make_filter(scheduler_config.frequency),
             &scheduler_actor_t::on_missing_check_timer, "missing data check");
}

void scheduler_actor_t::on_sync_timer(r::request_id_t timer_id, bool cancelled) noexcept {
    if (!release(jobs.sync, timer_id) || cancelled) {
        return;
    }
    if (is_trading_today(clock->now())) {
        run_sync(model::trigger_t::scheduled, {});
    }
    schedule(jobs.sync, scheduler_config.sync_time, make_filter(scheduler_config.frequency),
             &scheduler_actor_t::on_sync_timer, "sync");
}

void scheduler_actor_t::on_cleanup_timer(r::request_id_t timer_id, bool cancelled) noexcept {
    if (!release(jobs.cleanup, timer_id) || cancelled) {
        return;
    }
    run_housekeeping();
    schedule(jobs.cleanup, scheduler_config.cleanup_time, {}, &scheduler_actor_t::on_cleanup_timer, "housekeeping");
}

bool scheduler_actor_t::is_trading_today(const pt::ptime &now) noexcept {
    if (!scheduler_config.skip_non_trading_days) {
        return true;
    }
    auto today = now.date();
    auto r = calendar->is_trading_day(today, scheduler_config.market);
    if (!r) {
        LOG_ERROR(log, "cannot check whether {} is a trading day: {}", utils::format_date(today),
                  r.assume_error().message());
        return false;
    }
    if (!r.assume_value()) {
        LOG_INFO(log, "{} is not a trading day, skipping", utils::format_date(today));
        return false;
    }
    return true;
}

void scheduler_actor_t::run_missing_check() noexcept {
    if (detecting) {
        LOG_WARN(log, "missing data check is still in progress, the tick is skipped");
        return;
    }
    if (is_trading_today(clock->now())) {
        request_detection();
    }
}

void scheduler_actor_t::request_detection() noexcept {
    detecting = true;
    request<payload::detect_request_t>(detector, clock->now(), scheduler_config.lookback_days,
                                       scheduler_config.market)
        .send(request_timeout);
}

void scheduler_actor_t::on_detect(message::detect_response_t &res) noexcept {
    detecting = false;
    auto &ee = res.payload.ee;
    if (ee) {
        LOG_ERROR(log, "missing data check failure: {}", ee->message());
        if (sync_waits_detection) {
            sync_waits_detection = false;
            LOG_ERROR(log, "sync run {} cannot be planned without missing data report", current->run_id);
            stop_requested = true;
            finish_run();
        }
        return;
    }

    auto &report = res.payload.res.report;
    auto attention = report.needs_attention(scheduler_config.backfill_threshold);
    for (auto &unit : attention) {
        auto dates = report.find(unit);
        LOG_WARN(log, "unit '{}' misses {} date(s), manual investigation is required", unit, dates->size());
    }
    last_missing = std::move(report);

    if (sync_waits_detection) {
        sync_waits_detection = false;
        build_plan();
    }
}

void scheduler_actor_t::run_sync(model::trigger_t trigger, names_t selected_units) noexcept {
    if (current) {
        LOG_WARN(log, "sync run {} is still in progress, {} sync is skipped", current->run_id,
                 model::to_string(trigger));
        return;
    }
    auto now = clock->now();
    current = sync_report_t{};
    current->run_id = next_run_id++;
    current->trigger = trigger;
    current->started_at = now;
    selected = std::move(selected_units);
    stop_requested = false;
    plan.clear();
    LOG_INFO(log, "sync run {} ({}) is started", current->run_id, model::to_string(trigger));

    auto has_fresh_report = last_missing && last_missing->checked_at.date() == now.date();
    if (scheduler_config.smart_backfill && !has_fresh_report) {
        sync_waits_detection = true;
        if (!detecting) {
            request_detection();
        }
        return;
    }
    build_plan();
}

void scheduler_actor_t::build_plan() noexcept {
    auto names = names_t();
    if (selected.empty()) {
        for (auto &name : registry->names()) {
            if (registry->find(name)->is_enabled()) {
                names.emplace_back(name);
            }
        }
    } else {
        for (auto &name : selected) {
            if (registry->find(name)) {
                names.emplace_back(name);
            }
        }
    }

    auto order = registry->execution_plan(names, scheduler_config.include_optional_deps);
    if (!order) {
        LOG_ERROR(log, "cannot plan sync run {}: {}", current->run_id, order.assume_error().ec.message());
        stop_requested = true;
        return finish_run();
    }

    auto chosen = std::unordered_set<std::string_view>(names.begin(), names.end());
    auto today = clock->now().date();
    auto policy = model::backfill_policy_t(scheduler_config.backfill_threshold);
    auto in_plan = [&](const std::string &name) { return chosen.count(name) > 0; };
    auto no_dates = model::dates_t{};

    for (auto &name : order.assume_value()) {
        if (!in_plan(name)) {
            continue;
        }
        auto unit = registry->find(name);
        auto &report = current->units.emplace_back(unit_report_t{name});

        auto planned = planned_t{name, model::task_kind_t::incremental, {}, {}, {}};
        for (auto &dep : unit->get_dependencies()) {
            if (in_plan(dep)) {
                planned.required.emplace_back(dep);
            }
        }
        if (scheduler_config.include_optional_deps) {
            for (auto &dep : unit->get_optional_dependencies()) {
                if (in_plan(dep)) {
                    planned.ordered_after.emplace_back(dep);
                }
            }
        }

        if (unit->is_full_scan()) {
            planned.kind = model::task_kind_t::full;
            planned.partitions = {model::partition_t::all_history()};
        } else if (!scheduler_config.smart_backfill || unit->get_cadence() != model::cadence_t::daily) {
            planned.partitions = {model::partition_t(today)};
            report.decision = model::decision_t::incremental;
        } else {
            auto missing = last_missing ? last_missing->find(name) : nullptr;
            auto shape = policy.decide(missing ? *missing : no_dates, today);
            report.decision = shape.decision;
            report.missing_count = shape.missing_count;
            if (shape.decision == model::decision_t::skip_alert) {
                report.outcome = unit_outcome_t::skipped_alert;
                report.error = fmt::format("{} missing date(s), threshold is {}", shape.missing_count,
                                           policy.get_threshold());
                LOG_CRITICAL(log, "unit '{}' misses {} date(s) (threshold {}), automatic backfill is refused, "
                                  "manual investigation is required",
                             name, shape.missing_count, policy.get_threshold());
            }
            planned.kind = shape.kind;
            planned.partitions = std::move(shape.partitions);
        }
        report.partitions = planned.partitions.size();
        plan.emplace_back(std::move(planned));
    }
    LOG_DEBUG(log, "sync run {} plan: {}", current->run_id, boost::algorithm::join(names, ", "));
    advance();
}

void scheduler_actor_t::advance() noexcept {
    if (!current || sync_waits_detection) {
        return;
    }
    auto in_flight = std::size_t{0};
    for (auto &planned : plan) {
        auto unit = current->find(planned.unit);
        if (unit->outcome != unit_outcome_t::planned) {
            in_flight += unit->outcome == unit_outcome_t::submitted ? 1 : 0;
            continue;
        }

        // dependencies have to be terminal, whatever the outcome; the engine checks their data
        auto wait = false;
        for (auto deps : {&planned.required, &planned.ordered_after}) {
            for (auto &dep : *deps) {
                auto d = current->find(dep);
                wait = wait || d->outcome == unit_outcome_t::planned || d->outcome == unit_outcome_t::submitted;
            }
        }
        if (wait) {
            ++in_flight;
            continue;
        }

        unit->outcome = unit_outcome_t::submitted;
        ++in_flight;
        LOG_DEBUG(log, "submitting '{}' ({}, {} partition(s))", unit->unit, model::to_string(planned.kind),
                  planned.partitions.size());
        request<payload::submit_request_t>(engine, planned.unit, planned.kind, planned.partitions, current->trigger,
                                           false)
            .send(request_timeout);
    }
    if (!in_flight) {
        finish_run();
    }
}

void scheduler_actor_t::on_submit(message::submit_response_t &res) noexcept {
    auto &unit_name = res.payload.req->payload.request_payload.unit;
    if (!current) {
        return;
    }
    auto unit = current->find(unit_name);
    if (!unit || unit->outcome != unit_outcome_t::submitted || unit->task_id) {
        return;
    }

    auto &ee = res.payload.ee;
    if (ee) {
        auto ec = ee->root()->ec;
        unit->error = ee->message();
        if (is_dependency_failure(ec)) {
            unit->outcome = unit_outcome_t::skipped_dependency;
            LOG_WARN(log, "unit '{}' is skipped: {}", unit->unit, unit->error);
        } else {
            unit->outcome = unit_outcome_t::failed;
            unit->error_type = classify_error(unit->error);
            LOG_WARN(log, "unit '{}' cannot be submitted: {}", unit->unit, unit->error);
        }
        return advance();
    }

    auto &task = res.payload.res.task;
    unit->task_id = task->get_id();
    if (task->is_terminal()) {
        current->apply(task->make_record());
    } else if (stop_requested) {
        request<payload::task_cancel_request_t>(engine, task->get_id()).send(request_timeout);
    }
    advance();
}

void scheduler_actor_t::on_task_finished(message::task_finished_t &message) noexcept {
    if (!current) {
        return;
    }
    auto &record = message.payload.record;
    auto unit = current->find(record.unit);
    if (!unit || unit->task_id != record.id || unit->outcome != unit_outcome_t::submitted) {
        return;
    }
    current->apply(record);
    advance();
}

void scheduler_actor_t::on_cancel(message::task_cancel_response_t &res) noexcept {
    auto id = res.payload.req->payload.request_payload.task_id;
    auto &ee = res.payload.ee;
    if (ee) {
        LOG_DEBUG(log, "task {} cancellation failure: {}", id, ee->message());
        return;
    }
    LOG_DEBUG(log, "task {} cancellation: {}", id, res.payload.res.cancelled);
}

void scheduler_actor_t::cancel_submitted() noexcept {
    for (auto &unit : current->units) {
        if (unit.outcome == unit_outcome_t::planned) {
            unit.outcome = unit_outcome_t::cancelled;
            unit.error = "stopped";
        } else if (unit.outcome == unit_outcome_t::submitted && unit.task_id) {
            request<payload::task_cancel_request_t>(engine, *unit.task_id).send(request_timeout);
        }
    }
}

void scheduler_actor_t::finish_run() noexcept {
    current->finished_at = clock->now();
    current->status = stop_requested ? run_status_t::stopped : run_status_t::completed;
    LOG_INFO(log, "sync run {} is {}: {} completed, {} failed, {} skipped by dependency, {} skipped by alert, {} "
                  "cancelled",
             current->run_id, to_string(current->status), current->count(unit_outcome_t::completed),
             current->count(unit_outcome_t::failed), current->count(unit_outcome_t::skipped_dependency),
             current->count(unit_outcome_t::skipped_alert), current->count(unit_outcome_t::cancelled));

    auto report = std::move(*current);
    current.reset();
    plan.clear();
    selected.clear();
    last_sync = report;
    send<payload::sync_finished_t>(get_address(), std::move(report));
}

void scheduler_actor_t::run_housekeeping() noexcept {
    if (cleaning) {
        LOG_WARN(log, "housekeeping is still in progress, the tick is skipped");
        return;
    }
    cleaning = true;
    request<payload::history_cleanup_request_t>(history, scheduler_config.retention_days, clock->now())
        .send(request_timeout);
    send<payload::refresh_calendar_t>(detector);
}

void scheduler_actor_t::on_cleanup(message::history_cleanup_response_t &res) noexcept {
    cleaning = false;
    auto &ee = res.payload.ee;
    if (ee) {
        LOG_ERROR(log, "history cleanup failure: {}", ee->message());
        return;
    }
    LOG_DEBUG(log, "history cleanup removed {} record(s)", res.payload.res.removed);
}

void scheduler_actor_t::on_update_schedule(message::update_schedule_t &message) noexcept {
    scheduler_config = message.payload.config;
    LOG_INFO(log, "schedule is updated: enabled = {}, missing check at {}, sync at {}, cleanup at {}",
             scheduler_config.enabled, utils::format_time_of_day(scheduler_config.missing_check_time),
             utils::format_time_of_day(scheduler_config.sync_time),
             utils::format_time_of_day(scheduler_config.cleanup_time));
    cancel_all();
    if (state < r::state_t::SHUTTING_DOWN) {
        schedule_all();
    }
}

void scheduler_actor_t::on_set_unit_enabled(message::set_unit_enabled_t &message) noexcept {
    auto &p = message.payload;
    auto unit = registry->find(p.unit);
    if (!unit) {
        LOG_WARN(log, "cannot toggle unknown unit '{}'", p.unit);
        return;
    }
    unit->set_enabled(p.enabled);
    LOG_INFO(log, "unit '{}' is {}", p.unit, p.enabled ? "enabled" : "disabled");
}

void scheduler_actor_t::on_trigger_sync(message::trigger_sync_t &) noexcept {
    run_sync(model::trigger_t::manual, {});
}

void scheduler_actor_t::on_stop_sync(message::stop_sync_t &) noexcept {
    if (!current) {
        LOG_INFO(log, "no sync run in progress, nothing to stop");
        return;
    }
    LOG_INFO(log, "stopping sync run {}", current->run_id);
    stop_requested = true;
    if (sync_waits_detection) {
        sync_waits_detection = false;
        return finish_run();
    }
    cancel_submitted();
    advance();
}

void scheduler_actor_t::on_retry_failed(message::retry_failed_t &) noexcept {
    if (current) {
        LOG_WARN(log, "sync run {} is still in progress, retry is skipped", current->run_id);
        return;
    }
    if (!last_sync) {
        LOG_INFO(log, "no previous sync run, nothing to retry");
        return;
    }
    auto failed = last_sync->failed_units();
    if (failed.empty()) {
        LOG_INFO(log, "no failed units in sync run {}, nothing to retry", last_sync->run_id);
        return;
    }
    LOG_INFO(log, "retrying {} unit(s): {}", failed.size(), boost::algorithm::join(failed, ", "));
    run_sync(model::trigger_t::manual, std::move(failed));
}

void scheduler_actor_t::on_status(message::scheduler_status_request_t &req) noexcept {
    auto status = payload::scheduler_status_response_t{};
    status.running = current.has_value();
    status.config = scheduler_config;
    status.next_missing_check = jobs.missing_check.next;
    status.next_sync = jobs.sync.next;
    status.next_cleanup = jobs.cleanup.next;
    status.current = current;
    status.last_sync = last_sync;
    status.last_missing = last_missing;
    reply_to(req, std::move(status));
}
