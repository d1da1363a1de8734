// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "history_actor.h"
#include "names.h"

using namespace syncsched::core;

history_actor_t::history_actor_t(config_t &cfg)
    : r::actor_base_t(cfg), store{std::make_unique<db::history_store_t>(cfg.db_dir, cfg.db_config)} {}

void history_actor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    r::actor_base_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity(names::history, false);
        log = utils::get_logger(identity);
    });
    plugin.with_casted<r::plugin::registry_plugin_t>([&](auto &p) { p.register_name(names::history, get_address()); });
    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &p) {
        open();
        p.subscribe_actor(&history_actor_t::on_record);
        p.subscribe_actor(&history_actor_t::on_query);
        p.subscribe_actor(&history_actor_t::on_cleanup);
    });
}

void history_actor_t::open() noexcept {
    auto r = store->open();
    if (!r) {
        auto ec = r.assume_error();
        LOG_CRITICAL(log, "cannot open history database: {}", ec.message());
        return do_shutdown(make_error(ec));
    }
}

void history_actor_t::on_start() noexcept {
    LOG_TRACE(log, "on_start");
    r::actor_base_t::on_start();
}

void history_actor_t::shutdown_finish() noexcept {
    LOG_TRACE(log, "shutdown_finish");
    store.reset();
    r::actor_base_t::shutdown_finish();
}

void history_actor_t::on_record(message::record_t &message) noexcept {
    auto &record = message.payload.record;
    auto r = store->record(record);
    if (!r) {
        LOG_ERROR(log, "cannot store record of task {} ({}): {}", record.id, record.unit, r.assume_error().message());
    }
}

void history_actor_t::on_query(message::history_query_request_t &req) noexcept {
    auto r = store->query(req.payload.request_payload.query);
    if (!r) {
        auto ec = r.assume_error();
        LOG_ERROR(log, "history query failure: {}", ec.message());
        return reply_with_error(req, make_error(ec));
    }
    reply_to(req, std::move(r.assume_value()));
}

void history_actor_t::on_cleanup(message::history_cleanup_request_t &req) noexcept {
    auto &p = req.payload.request_payload;
    auto r = store->cleanup_older_than(p.retention_days, p.now);
    if (!r) {
        auto ec = r.assume_error();
        LOG_ERROR(log, "history cleanup failure: {}", ec.message());
        return reply_with_error(req, make_error(ec));
    }
    LOG_INFO(log, "{} record(s) older than {} day(s) are removed", r.assume_value(), p.retention_days);
    reply_to(req, r.assume_value());
}
