// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "schedule.h"

namespace syncsched::core {

pt::ptime system_clock_t::now() const noexcept { return pt::second_clock::local_time(); }

wall_clock_ptr_t make_system_clock() noexcept { return wall_clock_ptr_t(new system_clock_t()); }

schedule_t::schedule_t(pt::time_duration at_, day_filter_t filter_) noexcept
    : at{std::move(at_)}, filter{std::move(filter_)} {}

std::optional<pt::ptime> schedule_t::next_fire(const pt::ptime &now) const noexcept {
    auto day = now.date();
    if (pt::ptime(day, at) <= now) {
        day += gr::days(1);
    }
    for (std::uint32_t i = 0; i <= look_ahead_days; ++i, day += gr::days(1)) {
        if (!filter || filter(day)) {
            return pt::ptime(day, at);
        }
    }
    return {};
}

bool is_weekday(const gr::date &date) noexcept {
    auto wd = date.day_of_week().as_number();
    return wd != gr::Saturday && wd != gr::Sunday;
}

day_filter_t make_filter(config::frequency_t frequency) noexcept {
    if (frequency == config::frequency_t::weekdays) {
        return [](const gr::date &date) { return is_weekday(date); };
    }
    return {};
}

} // namespace syncsched::core
