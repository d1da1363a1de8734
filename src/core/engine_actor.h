// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/engine.h"
#include "messages.h"
#include "schedule.h"
#include "model/registry.h"
#include "utils/log.h"
#include "worker/messages.h"
#include "worker/worker_plugin.h"
#include "syncsched-export.h"

#include <rotor.hpp>
#include <deque>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace syncsched::core {

namespace outcome = boost::outcome_v2;

struct engine_actor_config_t : r::actor_config_t {
    model::registry_ptr_t registry;
    config::engine_config_t engine_config;
    wall_clock_ptr_t clock;
};

template <typename Actor> struct engine_actor_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&registry(const model::registry_ptr_t &value) && noexcept {
        parent_t::config.registry = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&engine_config(const config::engine_config_t &value) && noexcept {
        parent_t::config.engine_config = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&clock(const wall_clock_ptr_t &value) && noexcept {
        parent_t::config.clock = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/** \struct engine_actor_t
 *  \brief accepts tasks and runs at most K of them at once on the workers
 *
 * Tasks are started in submission order. A task submitted with dependency
 * auto-resolution stays pending (parked) until the tasks of its missing
 * dependencies are terminal; then the dependencies are re-checked and the
 * task is either queued or failed.
 *
 * Every terminal task is forwarded to the history actor and broadcast as
 * `task_finished` on the engine address.
 */
struct SYNCSCHED_API engine_actor_t : public r::actor_base_t {
    using config_t = engine_actor_config_t;
    template <typename Actor> using config_builder_t = engine_actor_config_builder_t<Actor>;

    // clang-format off
    using plugins_list_t = std::tuple<
        r::plugin::address_maker_plugin_t,
        r::plugin::lifetime_plugin_t,
        r::plugin::init_shutdown_plugin_t,
        r::plugin::link_server_plugin_t,
        r::plugin::link_client_plugin_t,
        worker::worker_plugin_t,
        r::plugin::resources_plugin_t,
        r::plugin::starter_plugin_t
    >;
    // clang-format on

    explicit engine_actor_t(config_t &cfg);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void shutdown_start() noexcept override;
    void shutdown_finish() noexcept override;

    template <typename T> auto &access() noexcept;

  private:
    using tasks_t = std::unordered_map<model::task_id_t, model::task_ptr_t>;
    using queue_t = std::deque<model::task_ptr_t>;
    using task_ids_t = std::unordered_set<model::task_id_t>;
    using running_t = std::unordered_map<model::task_id_t, std::uint32_t>;
    using finished_order_t = std::deque<model::task_id_t>;

    struct parked_t {
        model::task_ptr_t task;
        task_ids_t waits;
    };
    using parked_map_t = std::unordered_map<model::task_id_t, parked_t>;
    using waiters_t = std::unordered_map<model::task_id_t, std::vector<model::task_id_t>>;

    void on_submit(message::submit_request_t &req) noexcept;
    void on_task_status(message::task_status_request_t &req) noexcept;
    void on_task_cancel(message::task_cancel_request_t &req) noexcept;
    void on_set_concurrency(message::set_concurrency_t &message) noexcept;
    void on_executed(worker::message::executed_t &message) noexcept;
    void on_grace_timer(r::request_id_t, bool cancelled) noexcept;

    outcome::result<model::task_ptr_t> submit(const std::string &unit, model::task_kind_t kind,
                                              model::partitions_t partitions, model::trigger_t trigger,
                                              bool auto_resolve, std::string &details) noexcept;
    model::task_ptr_t make_task(const model::unit_ptr_t &unit, model::task_kind_t kind,
                                model::partitions_t partitions, model::trigger_t trigger) noexcept;
    model::task_ptr_t find_active(std::string_view unit) noexcept;
    model::task_ptr_t find_task(model::task_id_t id) noexcept;
    void park(model::task_ptr_t task, task_ids_t waits) noexcept;
    void unpark(model::task_id_t id) noexcept;
    void wake(model::task_id_t finished) noexcept;
    void enqueue(model::task_ptr_t task) noexcept;
    void dispatch() noexcept;
    void finish(model::task_ptr_t task, model::task_status_t status, std::string reason = {}) noexcept;
    void on_terminal(const model::task_ptr_t &task) noexcept;
    void remember(const model::task_ptr_t &task) noexcept;

    utils::logger_t log;
    model::registry_ptr_t registry;
    config::engine_config_t engine_config;
    wall_clock_ptr_t clock;
    worker::worker_plugin_t *workers = nullptr;
    r::address_ptr_t history;

    std::uint32_t concurrency;
    model::task_id_t next_id = 1;
    tasks_t active;
    queue_t queue;
    parked_map_t parked;
    waiters_t waiters;
    running_t running;
    tasks_t finished;
    finished_order_t finished_order;
    std::optional<r::request_id_t> grace_timer;
};

} // namespace syncsched::core
