// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "trade_calendar.h"
#include "misc/error_code.h"
#include "utils/error_code.h"
#include "utils/log.h"
#include "utils/time.h"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace syncsched::model {

csv_calendar_source_t::csv_calendar_source_t(bfs::path path_, std::string default_market_) noexcept
    : path{std::move(path_)}, default_market{std::move(default_market_)} {}

outcome::result<calendar_days_t> csv_calendar_source_t::load() noexcept {
    auto in = std::ifstream(path, std::ios::binary);
    if (!in) {
        auto log = utils::get_logger("model.calendar");
        LOG_ERROR(log, "cannot open trade calendar at '{}'", path.string());
        return utils::make_error_code(utils::error_code_t::calendar_source_failure);
    }
    std::stringstream buff;
    buff << in.rdbuf();
    return parse(buff.str(), default_market);
}

outcome::result<calendar_days_t> csv_calendar_source_t::parse(std::string_view content,
                                                              std::string_view default_market) noexcept {
    using boost::algorithm::trim_copy;
    calendar_days_t days;
    std::vector<std::string> columns;
    std::size_t line_no = 0;
    auto log = utils::get_logger("model.calendar");

    auto stream = std::istringstream(std::string(content));
    std::string line;
    while (std::getline(stream, line)) {
        ++line_no;
        auto trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        columns.clear();
        boost::algorithm::split(columns, trimmed, boost::is_any_of(","));
        for (auto &c : columns) {
            boost::algorithm::trim(c);
        }
        if (columns.size() < 2) {
            LOG_WARN(log, "trade calendar line {} is malformed, skipping", line_no);
            continue;
        }
        auto date = utils::parse_date(columns[0]);
        if (!date) {
            if (line_no == 1) {
                continue; // header
            }
            LOG_WARN(log, "trade calendar line {} has malformed date '{}', skipping", line_no, columns[0]);
            continue;
        }
        auto &open = columns[1];
        auto is_open = open == "1" || boost::algorithm::iequals(open, "true");
        auto market = columns.size() > 2 && !columns[2].empty() ? boost::algorithm::to_lower_copy(columns[2])
                                                                : std::string(default_market);
        days.emplace_back(calendar_day_t{date.value(), is_open, std::move(market)});
    }
    return days;
}

memory_calendar_source_t::memory_calendar_source_t(calendar_days_t days_) noexcept : days{std::move(days_)} {}

outcome::result<calendar_days_t> memory_calendar_source_t::load() noexcept {
    auto lock = std::lock_guard(mutex);
    return days;
}

void memory_calendar_source_t::assign(calendar_days_t days_) noexcept {
    auto lock = std::lock_guard(mutex);
    days = std::move(days_);
}

trade_calendar_t::trade_calendar_t(calendar_source_ptr_t source_, std::string default_market_) noexcept
    : source{std::move(source_)}, default_market{std::move(default_market_)},
      snapshot{std::make_shared<const markets_t>()} {}

outcome::result<void> trade_calendar_t::refresh() noexcept {
    auto log = utils::get_logger("model.calendar");
    auto days_opt = source->load();
    if (!days_opt) {
        LOG_ERROR(log, "cannot load trade calendar: {}", days_opt.assume_error().message());
        return days_opt.assume_error();
    }
    auto &days = days_opt.assume_value();
    if (days.empty()) {
        LOG_ERROR(log, "trade calendar source is empty");
        return make_error_code(error_code_t::calendar_unavailable);
    }

    auto markets = std::make_shared<markets_t>();
    for (auto &day : days) {
        auto &m = (*markets)[day.market];
        if (m.first.is_special() || day.date < m.first) {
            m.first = day.date;
        }
        if (m.last.is_special() || day.date > m.last) {
            m.last = day.date;
        }
        if (day.is_open) {
            m.open_days.emplace_back(day.date);
        }
    }
    for (auto &it : *markets) {
        auto &open = it.second.open_days;
        std::sort(open.begin(), open.end());
        open.erase(std::unique(open.begin(), open.end()), open.end());
        LOG_DEBUG(log, "market '{}': {} trading days in [{}, {}]", it.first, open.size(),
                  utils::format_date(it.second.first), utils::format_date(it.second.last));
    }

    auto lock = std::lock_guard(mutex);
    snapshot = std::move(markets);
    LOG_INFO(log, "trade calendar has been loaded ({} markets)", snapshot->size());
    return outcome::success();
}

auto trade_calendar_t::get_snapshot() const noexcept -> snapshot_t {
    auto lock = std::lock_guard(mutex);
    return snapshot;
}

auto trade_calendar_t::get_market(const snapshot_t &snapshot, std::string_view market) const noexcept
    -> outcome::result<const market_t *> {
    auto name = std::string(market.empty() ? std::string_view(default_market) : market);
    auto it = snapshot->find(name);
    if (it == snapshot->end()) {
        return make_error_code(error_code_t::calendar_unavailable);
    }
    return &it->second;
}

bool trade_calendar_t::is_loaded(std::string_view market) const noexcept {
    return get_market(get_snapshot(), market).has_value();
}

std::size_t trade_calendar_t::total_days(std::string_view market) const noexcept {
    auto s = get_snapshot();
    auto m = get_market(s, market);
    return m ? m.value()->open_days.size() : 0;
}

auto trade_calendar_t::date_range(std::string_view market) const noexcept -> outcome::result<date_range_t> {
    auto s = get_snapshot();
    auto m = get_market(s, market);
    if (!m) {
        return m.assume_error();
    }
    return date_range_t{m.value()->first, m.value()->last};
}

outcome::result<bool> trade_calendar_t::is_trading_day(const gr::date &date, std::string_view market) const noexcept {
    auto s = get_snapshot();
    auto m = get_market(s, market);
    if (!m) {
        return m.assume_error();
    }
    auto &days = *m.value();
    if (!days.covers(date)) {
        return make_error_code(error_code_t::calendar_unavailable);
    }
    return std::binary_search(days.open_days.begin(), days.open_days.end(), date);
}

outcome::result<dates_t> trade_calendar_t::recent_trading_days(std::size_t n, const gr::date &end,
                                                               std::string_view market) const noexcept {
    auto s = get_snapshot();
    auto m = get_market(s, market);
    if (!m) {
        return m.assume_error();
    }
    auto &days = *m.value();
    if (!days.covers(end)) {
        return make_error_code(error_code_t::calendar_unavailable);
    }
    auto &open = days.open_days;
    auto last = std::upper_bound(open.begin(), open.end(), end);
    auto count = std::min<std::size_t>(n, static_cast<std::size_t>(std::distance(open.begin(), last)));
    return dates_t(last - count, last);
}

outcome::result<dates_t> trade_calendar_t::trading_days_between(const gr::date &start, const gr::date &end,
                                                                std::string_view market) const noexcept {
    auto s = get_snapshot();
    auto m = get_market(s, market);
    if (!m) {
        return m.assume_error();
    }
    auto &days = *m.value();
    if (start > end) {
        return dates_t{};
    }
    if (!days.covers(start) || !days.covers(end)) {
        return make_error_code(error_code_t::calendar_unavailable);
    }
    auto &open = days.open_days;
    auto first = std::lower_bound(open.begin(), open.end(), start);
    auto last = std::upper_bound(first, open.end(), end);
    return dates_t(first, last);
}

outcome::result<gr::date> trade_calendar_t::previous_trading_day(const gr::date &date,
                                                                 std::string_view market) const noexcept {
    return trading_day_offset(date, -1, market);
}

outcome::result<gr::date> trade_calendar_t::next_trading_day(const gr::date &date,
                                                             std::string_view market) const noexcept {
    return trading_day_offset(date, 1, market);
}

outcome::result<gr::date> trade_calendar_t::trading_day_offset(const gr::date &date, int offset,
                                                               std::string_view market) const noexcept {
    auto s = get_snapshot();
    auto m = get_market(s, market);
    if (!m) {
        return m.assume_error();
    }
    auto &days = *m.value();
    if (!days.covers(date)) {
        return make_error_code(error_code_t::calendar_unavailable);
    }
    auto &open = days.open_days;
    if (offset > 0) {
        auto it = std::upper_bound(open.begin(), open.end(), date);
        auto left = static_cast<std::size_t>(std::distance(it, open.end()));
        if (left < static_cast<std::size_t>(offset)) {
            return make_error_code(error_code_t::calendar_unavailable);
        }
        return *(it + (offset - 1));
    }
    auto it = std::upper_bound(open.begin(), open.end(), date);
    if (offset < 0) {
        it = std::lower_bound(open.begin(), open.end(), date);
    }
    auto steps = static_cast<std::size_t>(offset == 0 ? 1 : -offset);
    auto available = static_cast<std::size_t>(std::distance(open.begin(), it));
    if (available < steps) {
        return make_error_code(error_code_t::calendar_unavailable);
    }
    return *(it - steps);
}

} // namespace syncsched::model
