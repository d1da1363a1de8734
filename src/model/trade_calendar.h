// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "misc/arc.hpp"
#include "partition.h"
#include <boost/outcome.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include "syncsched-export.h"

namespace syncsched::model {

namespace outcome = boost::outcome_v2;
namespace bfs = std::filesystem;

struct calendar_day_t {
    gr::date date;
    bool is_open;
    std::string market;
};

using calendar_days_t = std::vector<calendar_day_t>;

/** \struct calendar_source_t
 *  \brief bulk reference source of (date, is_open) pairs
 */
struct SYNCSCHED_API calendar_source_t : arc_base_t<calendar_source_t> {
    virtual ~calendar_source_t() = default;
    virtual outcome::result<calendar_days_t> load() noexcept = 0;
};

using calendar_source_ptr_t = intrusive_ptr_t<calendar_source_t>;

/** \struct csv_calendar_source_t
 *  \brief reads `cal_date,is_open[,exchange]` lines, the header line is optional
 */
struct SYNCSCHED_API csv_calendar_source_t final : calendar_source_t {
    csv_calendar_source_t(bfs::path path, std::string default_market) noexcept;

    outcome::result<calendar_days_t> load() noexcept override;

    static outcome::result<calendar_days_t> parse(std::string_view content, std::string_view default_market) noexcept;

  private:
    bfs::path path;
    std::string default_market;
};

/** \struct memory_calendar_source_t
 *  \brief pre-loaded calendar days, the days can be replaced between refreshes
 */
struct SYNCSCHED_API memory_calendar_source_t final : calendar_source_t {
    memory_calendar_source_t(calendar_days_t days = {}) noexcept;

    outcome::result<calendar_days_t> load() noexcept override;
    void assign(calendar_days_t days) noexcept;

  private:
    std::mutex mutex;
    calendar_days_t days;
};

struct trade_calendar_t;
using trade_calendar_ptr_t = intrusive_ptr_t<trade_calendar_t>;

/** \struct trade_calendar_t
 *  \brief in-memory trading calendar oracle
 *
 * All queries are answered from an immutable snapshot; `refresh` builds a new
 * snapshot from the source and swaps it atomically, so readers never observe
 * a partially loaded calendar. A failed refresh keeps the previous snapshot.
 *
 * Queries for an unloaded market or for dates outside of the loaded range
 * fail with `calendar_unavailable`; nothing is ever assumed to be open.
 */
struct SYNCSCHED_API trade_calendar_t : arc_base_t<trade_calendar_t> {
    using date_range_t = std::pair<gr::date, gr::date>;

    trade_calendar_t(calendar_source_ptr_t source, std::string default_market = "cn") noexcept;

    outcome::result<void> refresh() noexcept;

    bool is_loaded(std::string_view market = {}) const noexcept;
    std::size_t total_days(std::string_view market = {}) const noexcept;
    outcome::result<date_range_t> date_range(std::string_view market = {}) const noexcept;

    outcome::result<bool> is_trading_day(const gr::date &date, std::string_view market = {}) const noexcept;

    /** up to `n` last trading days not after `end`, ascending */
    outcome::result<dates_t> recent_trading_days(std::size_t n, const gr::date &end,
                                                 std::string_view market = {}) const noexcept;

    /** trading days in `[start, end]`, ascending */
    outcome::result<dates_t> trading_days_between(const gr::date &start, const gr::date &end,
                                                  std::string_view market = {}) const noexcept;

    outcome::result<gr::date> previous_trading_day(const gr::date &date, std::string_view market = {}) const noexcept;
    outcome::result<gr::date> next_trading_day(const gr::date &date, std::string_view market = {}) const noexcept;

    /** zero offset yields the date itself when open, the previous trading day otherwise */
    outcome::result<gr::date> trading_day_offset(const gr::date &date, int offset,
                                                 std::string_view market = {}) const noexcept;

    inline std::string_view get_default_market() const noexcept { return default_market; }

  private:
    struct market_t {
        dates_t open_days;
        gr::date first;
        gr::date last;

        inline bool covers(const gr::date &date) const noexcept { return date >= first && date <= last; }
    };
    using markets_t = std::unordered_map<std::string, market_t>;
    using snapshot_t = std::shared_ptr<const markets_t>;

    snapshot_t get_snapshot() const noexcept;
    outcome::result<const market_t *> get_market(const snapshot_t &, std::string_view market) const noexcept;

    calendar_source_ptr_t source;
    std::string default_market;
    mutable std::mutex mutex;
    snapshot_t snapshot;
};

} // namespace syncsched::model
