// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "missing_data.h"
#include "utils/log.h"
#include "utils/time.h"

namespace syncsched::model {

std::size_t missing_report_t::units_with_gaps() const noexcept {
    std::size_t r = 0;
    for (auto &u : units) {
        r += u.missing.empty() ? 0 : 1;
    }
    return r;
}

std::size_t missing_report_t::total_missing() const noexcept {
    std::size_t r = 0;
    for (auto &u : units) {
        r += u.missing.size();
    }
    return r;
}

auto missing_report_t::needs_attention(std::uint32_t threshold) const noexcept -> names_t {
    names_t r;
    for (auto &u : units) {
        if (u.missing.size() > threshold) {
            r.emplace_back(u.unit);
        }
    }
    return r;
}

const dates_t *missing_report_t::find(std::string_view unit) const noexcept {
    for (auto &u : units) {
        if (u.unit == unit) {
            return &u.missing;
        }
    }
    return nullptr;
}

outcome::result<missing_report_t> detect_missing(const trade_calendar_t &calendar, const registry_t &registry,
                                                 std::uint32_t lookback_days, const gr::date &end,
                                                 const pt::ptime &now, std::string_view market) noexcept {
    auto log = utils::get_logger("model.detector");
    auto days_opt = calendar.recent_trading_days(lookback_days, end, market);
    if (!days_opt) {
        LOG_ERROR(log, "cannot determine trading days window ending at {}: {}", utils::format_date(end),
                  days_opt.assume_error().message());
        return days_opt.assume_error();
    }
    auto &days = days_opt.assume_value();

    auto r = missing_report_t{};
    r.checked_at = now;
    if (!days.empty()) {
        r.window_start = days.front();
        r.window_end = days.back();
    }

    for (auto &name : registry.names()) {
        auto unit = registry.find(name);
        if (!unit->is_enabled() || unit->get_cadence() != cadence_t::daily) {
            LOG_TRACE(log, "skipping unit '{}'", name);
            continue;
        }
        auto gaps = unit_gaps_t{name, {}, {}};
        auto &probe = unit->get_probe();
        for (auto &day : days) {
            if (probe.has_data(partition_t(day))) {
                gaps.latest = day;
            } else {
                gaps.missing.emplace_back(day);
            }
        }
        if (!gaps.missing.empty()) {
            LOG_DEBUG(log, "unit '{}' misses {} of {} trading days", name, gaps.missing.size(), days.size());
        }
        r.units.emplace_back(std::move(gaps));
    }

    LOG_INFO(log, "missing data detection complete: {}/{} units have gaps, {} missing dates in [{}, {}]",
             r.units_with_gaps(), r.units_checked(), r.total_missing(), utils::format_date(r.window_start),
             utils::format_date(r.window_end));
    return r;
}

} // namespace syncsched::model
