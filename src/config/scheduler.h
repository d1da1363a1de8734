// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include <cstdint>
#include <string>
#include <boost/date_time/posix_time/posix_time_duration.hpp>

namespace syncsched::config {

enum class frequency_t { daily, weekdays };

struct scheduler_config_t {
    using time_of_day_t = boost::posix_time::time_duration;

    bool enabled;
    time_of_day_t missing_check_time;
    time_of_day_t sync_time;
    time_of_day_t cleanup_time;
    frequency_t frequency;
    bool skip_non_trading_days;
    bool include_optional_deps;
    bool smart_backfill;
    std::uint32_t backfill_threshold;
    std::uint32_t lookback_days;
    std::uint32_t retention_days;
    std::string market;
};

} // namespace syncsched::config
