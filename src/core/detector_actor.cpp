// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "detector_actor.h"
#include "names.h"
#include "utils/time.h"

using namespace syncsched::core;

detector_actor_t::detector_actor_t(config_t &cfg)
    : r::actor_base_t(cfg), registry{cfg.registry}, calendar{cfg.calendar} {}

void detector_actor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    r::actor_base_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity(names::detector, false);
        log = utils::get_logger(identity);
    });
    plugin.with_casted<r::plugin::registry_plugin_t>([&](auto &p) { p.register_name(names::detector, get_address()); });
    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &p) {
        p.subscribe_actor(&detector_actor_t::on_detect);
        p.subscribe_actor(&detector_actor_t::on_refresh);
    });
}

void detector_actor_t::on_start() noexcept {
    LOG_TRACE(log, "on_start");
    r::actor_base_t::on_start();
}

void detector_actor_t::shutdown_finish() noexcept {
    LOG_TRACE(log, "shutdown_finish");
    r::actor_base_t::shutdown_finish();
}

void detector_actor_t::on_detect(message::detect_request_t &req) noexcept {
    auto &p = req.payload.request_payload;
    auto today = p.now.date();
    auto end = calendar->previous_trading_day(today, p.market);
    if (!end) {
        auto ec = end.assume_error();
        LOG_ERROR(log, "cannot determine check window for {}: {}", utils::format_date(today), ec.message());
        return reply_with_error(req, make_error(ec));
    }

    auto r = model::detect_missing(*calendar, *registry, p.lookback_days, end.assume_value(), p.now, p.market);
    if (!r) {
        auto ec = r.assume_error();
        LOG_ERROR(log, "missing data detection failure: {}", ec.message());
        return reply_with_error(req, make_error(ec));
    }
    auto &report = r.assume_value();
    LOG_INFO(log, "checked {} unit(s) over [{}, {}], {} with gaps, {} missing date(s) total", report.units_checked(),
             utils::format_date(report.window_start), utils::format_date(report.window_end),
             report.units_with_gaps(), report.total_missing());
    reply_to(req, std::move(report));
}

void detector_actor_t::on_refresh(message::refresh_calendar_t &) noexcept {
    auto r = calendar->refresh();
    if (!r) {
        LOG_ERROR(log, "trade calendar refresh failure, the previous calendar is kept: {}", r.assume_error().message());
        return;
    }
    auto range = calendar->date_range();
    if (range) {
        auto &[first, last] = range.assume_value();
        LOG_INFO(log, "trade calendar is refreshed, {} day(s) in [{}, {}]", calendar->total_days(),
                 utils::format_date(first), utils::format_date(last));
    }
}
