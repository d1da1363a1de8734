// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "worker_supervisor.h"
#include "worker_actor.h"
#include <fmt/format.h>

using namespace syncsched::worker;

worker_supervisor_t::worker_supervisor_t(config_t &config)
    : parent_t(config), index{config.index}, runner{std::move(config.runner)} {
    log = utils::get_logger("worker.supervisor");
}

void worker_supervisor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    parent_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>(
        [&](auto &p) { p.set_identity(fmt::format("worker::supervisor-{}", index), false); });
    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &) { launch(); });
}

void worker_supervisor_t::launch() noexcept {
    create_actor<worker_actor_t>().index(index).runner(runner).timeout(shutdown_timeout).finish();
}

void worker_supervisor_t::on_start() noexcept {
    LOG_TRACE(log, "{}, on_start", identity);
    r::actor_base_t::on_start();
}
