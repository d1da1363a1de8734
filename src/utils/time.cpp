// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2024-2026 Ivan Baidakou

#include "time.h"
#include "error_code.h"
#include <fmt/format.h>
#include <charconv>

namespace syncsched::utils {

static const pt::ptime epoch(gr::date(1970, 1, 1));

std::int64_t as_seconds(const pt::ptime &t) noexcept {
    auto time_diff = t - epoch;
    auto value = time_diff.ticks() / time_diff.ticks_per_second();
    return value;
}

std::int64_t as_microseconds(const pt::ptime &t) noexcept { return (t - epoch).total_microseconds(); }

pt::ptime from_microseconds(std::int64_t value) noexcept { return epoch + pt::microseconds(value); }

template <typename T> static bool parse_number(std::string_view str, T &value) noexcept {
    if (str.empty()) {
        return false;
    }
    auto end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    return ec == std::errc() && ptr == end;
}

outcome::result<gr::date> parse_date(std::string_view value) noexcept {
    std::string_view y, m, d;
    if (value.size() == 8) {
        y = value.substr(0, 4);
        m = value.substr(4, 2);
        d = value.substr(6, 2);
    } else if (value.size() == 10 && value[4] == '-' && value[7] == '-') {
        y = value.substr(0, 4);
        m = value.substr(5, 2);
        d = value.substr(8, 2);
    } else {
        return make_error_code(error_code_t::malformed_date);
    }

    int year = 0, month = 0, day = 0;
    if (!parse_number(y, year) || !parse_number(m, month) || !parse_number(d, day)) {
        return make_error_code(error_code_t::malformed_date);
    }
    try {
        return gr::date(year, month, day);
    } catch (const std::out_of_range &) {
        return make_error_code(error_code_t::malformed_date);
    }
}

std::string format_date(const gr::date &date) noexcept {
    if (date.is_special()) {
        return "-";
    }
    auto ymd = date.year_month_day();
    return fmt::format("{:04}{:02}{:02}", static_cast<int>(ymd.year), static_cast<int>(ymd.month),
                       static_cast<int>(ymd.day));
}

outcome::result<pt::time_duration> parse_time_of_day(std::string_view value) noexcept {
    auto p = value.find(':');
    if (p == value.npos) {
        return make_error_code(error_code_t::malformed_time);
    }
    int hours = 0, minutes = 0;
    if (!parse_number(value.substr(0, p), hours) || !parse_number(value.substr(p + 1), minutes)) {
        return make_error_code(error_code_t::malformed_time);
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        return make_error_code(error_code_t::malformed_time);
    }
    return pt::hours(hours) + pt::minutes(minutes);
}

std::string format_time_of_day(const pt::time_duration &value) noexcept {
    return fmt::format("{:02}:{:02}", value.hours(), value.minutes());
}

} // namespace syncsched::utils
