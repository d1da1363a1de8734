// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "core_supervisor.h"
#include "detector_actor.h"
#include "engine_actor.h"
#include "history_actor.h"
#include "names.h"
#include "scheduler_actor.h"

using namespace syncsched::core;

core_supervisor_t::core_supervisor_t(config_t &cfg)
    : parent_t(cfg), app_config{cfg.app_config}, registry{cfg.registry}, calendar{cfg.calendar}, clock{cfg.clock} {
    if (!clock) {
        clock = make_system_clock();
    }
}

void core_supervisor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    parent_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity("core.supervisor", false);
        log = utils::get_logger(identity);
    });
}

void core_supervisor_t::on_start() noexcept {
    LOG_TRACE(log, "on_start");
    parent_t::on_start();
    launch();
}

void core_supervisor_t::launch() noexcept {
    auto timeout = shutdown_timeout * 9 / 10;
    auto &engine_config = app_config.engine_config;
    auto engine_timeout = timeout + r::pt::milliseconds{engine_config.shutdown_grace_ms};
    auto request_timeout = r::pt::milliseconds{app_config.timeout};

    create_actor<history_actor_t>()
        .db_dir(app_config.db_dir)
        .db_config(app_config.db_config)
        .timeout(timeout)
        .escalate_failure()
        .finish();
    create_actor<detector_actor_t>().registry(registry).calendar(calendar).timeout(timeout).escalate_failure().finish();
    create_actor<engine_actor_t>()
        .registry(registry)
        .engine_config(engine_config)
        .clock(clock)
        .timeout(engine_timeout)
        .escalate_failure()
        .finish();
    create_actor<scheduler_actor_t>()
        .registry(registry)
        .calendar(calendar)
        .clock(clock)
        .scheduler_config(app_config.scheduler_config)
        .request_timeout(request_timeout)
        .timeout(timeout)
        .escalate_failure()
        .finish();
}

void core_supervisor_t::on_child_shutdown(actor_base_t *actor) noexcept {
    parent_t::on_child_shutdown(actor);
    auto &reason = actor->get_shutdown_reason();
    LOG_TRACE(log, "on_child_shutdown, '{}' due to {} ", actor->get_identity(), reason->message());
}

void core_supervisor_t::shutdown_finish() noexcept {
    LOG_TRACE(log, "shutdown_finish");
    parent_t::shutdown_finish();
}
