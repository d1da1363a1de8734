// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2024-2026 Ivan Baidakou

#pragma once

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/outcome.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include "syncsched-export.h"

namespace syncsched::utils {

namespace pt = boost::posix_time;
namespace gr = boost::gregorian;
namespace outcome = boost::outcome_v2;

SYNCSCHED_API std::int64_t as_seconds(const pt::ptime &t) noexcept;
SYNCSCHED_API std::int64_t as_microseconds(const pt::ptime &t) noexcept;
SYNCSCHED_API pt::ptime from_microseconds(std::int64_t value) noexcept;

/** \brief parses `YYYYMMDD` or `YYYY-MM-DD` */
SYNCSCHED_API outcome::result<gr::date> parse_date(std::string_view value) noexcept;

/** \brief formats date as `YYYYMMDD` */
SYNCSCHED_API std::string format_date(const gr::date &date) noexcept;

/** \brief parses `HH:MM` into the offset from midnight */
SYNCSCHED_API outcome::result<pt::time_duration> parse_time_of_day(std::string_view value) noexcept;

/** \brief formats offset from midnight as `HH:MM` */
SYNCSCHED_API std::string format_time_of_day(const pt::time_duration &value) noexcept;

} // namespace syncsched::utils
