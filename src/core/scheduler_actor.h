// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/scheduler.h"
#include "messages.h"
#include "schedule.h"
#include "sync_report.h"
#include "model/backfill_policy.h"
#include "model/registry.h"
#include "model/trade_calendar.h"
#include "utils/log.h"
#include "syncsched-export.h"

#include <rotor.hpp>
#include <optional>
#include <vector>

namespace syncsched::core {

struct scheduler_actor_config_t : r::actor_config_t {
    model::registry_ptr_t registry;
    model::trade_calendar_ptr_t calendar;
    wall_clock_ptr_t clock;
    config::scheduler_config_t scheduler_config;
    r::pt::time_duration request_timeout;
};

template <typename Actor> struct scheduler_actor_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&registry(const model::registry_ptr_t &value) && noexcept {
        parent_t::config.registry = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&calendar(const model::trade_calendar_ptr_t &value) && noexcept {
        parent_t::config.calendar = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&clock(const wall_clock_ptr_t &value) && noexcept {
        parent_t::config.clock = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&scheduler_config(const config::scheduler_config_t &value) && noexcept {
        parent_t::config.scheduler_config = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&request_timeout(const r::pt::time_duration &value) && noexcept {
        parent_t::config.request_timeout = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/** \struct scheduler_actor_t
 *  \brief timer-driven orchestrator of the daily jobs
 *
 * Three daily jobs are maintained: the missing data check, the sync plan run
 * and the housekeeping (history cleanup and calendar refresh). A job which is
 * still in progress when its next tick (or a manual trigger) arrives is not
 * started twice; the tick is skipped with a warning.
 *
 * A sync plan is run in the dependency order: a unit is submitted to the
 * engine only when the tasks of all its in-plan dependencies are terminal.
 * The outcome of a dependency does not matter: the engine checks the
 * dependency data on submit and the rejected unit is reported as skipped.
 */
struct SYNCSCHED_API scheduler_actor_t : public r::actor_base_t {
    using config_t = scheduler_actor_config_t;
    template <typename Actor> using config_builder_t = scheduler_actor_config_builder_t<Actor>;
    using names_t = std::vector<std::string>;

    struct job_t {
        std::optional<r::request_id_t> timer;
        std::optional<pt::ptime> next;
    };

    struct jobs_t {
        job_t missing_check;
        job_t sync;
        job_t cleanup;
    };

    explicit scheduler_actor_t(config_t &cfg);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void shutdown_start() noexcept override;
    void shutdown_finish() noexcept override;

    template <typename T> auto &access() noexcept;

  private:
    using timer_handler_t = void (scheduler_actor_t::*)(r::request_id_t, bool) noexcept;

    struct planned_t {
        std::string unit;
        model::task_kind_t kind;
        model::partitions_t partitions;
        names_t required;
        names_t ordered_after;
    };
    using plan_t = std::vector<planned_t>;

    void on_task_finished(message::task_finished_t &message) noexcept;
    void on_submit(message::submit_response_t &res) noexcept;
    void on_cancel(message::task_cancel_response_t &res) noexcept;
    void on_detect(message::detect_response_t &res) noexcept;
    void on_cleanup(message::history_cleanup_response_t &res) noexcept;
    void on_update_schedule(message::update_schedule_t &message) noexcept;
    void on_set_unit_enabled(message::set_unit_enabled_t &message) noexcept;
    void on_trigger_sync(message::trigger_sync_t &) noexcept;
    void on_stop_sync(message::stop_sync_t &) noexcept;
    void on_retry_failed(message::retry_failed_t &) noexcept;
    void on_status(message::scheduler_status_request_t &req) noexcept;

    void on_missing_check_timer(r::request_id_t, bool cancelled) noexcept;
    void on_sync_timer(r::request_id_t, bool cancelled) noexcept;
    void on_cleanup_timer(r::request_id_t, bool cancelled) noexcept;

    void schedule_all() noexcept;
    void schedule(job_t &job, const pt::time_duration &at, day_filter_t filter, timer_handler_t handler,
                  std::string_view name) noexcept;
    void cancel(job_t &job) noexcept;
    void cancel_all() noexcept;
    bool release(job_t &job, r::request_id_t timer_id) noexcept;

    bool is_trading_today(const pt::ptime &now) noexcept;
    void run_missing_check() noexcept;
    void request_detection() noexcept;
    void run_sync(model::trigger_t trigger, names_t selected) noexcept;
    void build_plan() noexcept;
    void advance() noexcept;
    void cancel_submitted() noexcept;
    void finish_run() noexcept;
    void run_housekeeping() noexcept;

    utils::logger_t log;
    model::registry_ptr_t registry;
    model::trade_calendar_ptr_t calendar;
    wall_clock_ptr_t clock;
    config::scheduler_config_t scheduler_config;
    r::pt::time_duration request_timeout;

    r::address_ptr_t engine;
    r::address_ptr_t detector;
    r::address_ptr_t history;

    jobs_t jobs;
    bool detecting = false;
    bool cleaning = false;
    bool sync_waits_detection = false;
    bool stop_requested = false;
    std::uint64_t next_run_id = 1;
    names_t selected;
    plan_t plan;
    std::optional<sync_report_t> current;
    std::optional<sync_report_t> last_sync;
    std::optional<model::missing_report_t> last_missing;
};

} // namespace syncsched::core
