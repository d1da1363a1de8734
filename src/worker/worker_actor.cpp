// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "worker_actor.h"
#include "names.h"

using namespace syncsched::worker;

worker_actor_t::worker_actor_t(config_t &cfg) : r::actor_base_t(cfg), index(cfg.index), runner(cfg.runner) {}

void worker_actor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    r::actor_base_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity(names::worker(index), false);
        log = utils::get_logger(identity);
    });
    plugin.with_casted<r::plugin::registry_plugin_t>([&](auto &p) { p.register_name(identity, get_address()); });

    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &p) { p.subscribe_actor(&worker_actor_t::on_execute); });
}

void worker_actor_t::on_start() noexcept {
    LOG_TRACE(log, "{}, on_start", identity);
    r::actor_base_t::on_start();
}

void worker_actor_t::shutdown_finish() noexcept {
    LOG_TRACE(log, "{}, shutdown_finish", identity);
    get_supervisor().shutdown();
    r::actor_base_t::shutdown_finish();
}

void worker_actor_t::on_execute(message::execute_t &req) noexcept {
    auto &task = req.payload.task;
    LOG_DEBUG(log, "{}, executing task {} ({})", identity, task->get_id(), task->get_unit().get_name());
    auto status = runner.run(*task);
    send<payload::executed_t>(req.payload.back_addr, task, status, index);
}
