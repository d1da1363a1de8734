// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "registry.h"
#include "trade_calendar.h"
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/outcome.hpp>
#include <string>
#include <string_view>
#include <vector>
#include "syncsched-export.h"

namespace syncsched::model {

namespace pt = boost::posix_time;

struct unit_gaps_t {
    std::string unit;
    dates_t missing;
    /** the latest date within the window having data, not-a-date if none */
    gr::date latest;
};

/** \struct missing_report_t
 *  \brief ephemeral result of a single detection run
 */
struct SYNCSCHED_API missing_report_t {
    using names_t = std::vector<std::string>;

    pt::ptime checked_at;
    gr::date window_start;
    gr::date window_end;
    std::vector<unit_gaps_t> units;

    inline std::size_t units_checked() const noexcept { return units.size(); }
    std::size_t units_with_gaps() const noexcept;
    std::size_t total_missing() const noexcept;

    /** units with more than `threshold` missing dates */
    names_t needs_attention(std::uint32_t threshold) const noexcept;

    /** nullptr if the unit was not checked */
    const dates_t *find(std::string_view unit) const noexcept;
};

/** \brief per-date gap detection for enabled daily-cadence units
 *
 * The window is the last `lookback_days` trading days up to and including
 * `end`. Units of other cadences are not checked at all.
 */
SYNCSCHED_API outcome::result<missing_report_t> detect_missing(const trade_calendar_t &calendar,
                                                               const registry_t &registry,
                                                               std::uint32_t lookback_days, const gr::date &end,
                                                               const pt::ptime &now,
                                                               std::string_view market = {}) noexcept;

} // namespace syncsched::model
