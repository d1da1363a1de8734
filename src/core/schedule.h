// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/scheduler.h"
#include "model/misc/arc.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <functional>
#include <optional>
#include "syncsched-export.h"

namespace syncsched::core {

namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

/** \struct wall_clock_t
 *  \brief source of the local time for the scheduling decisions */
struct SYNCSCHED_API wall_clock_t : model::arc_base_t<wall_clock_t> {
    virtual ~wall_clock_t() = default;
    virtual pt::ptime now() const noexcept = 0;
};

using wall_clock_ptr_t = model::intrusive_ptr_t<wall_clock_t>;

struct SYNCSCHED_API system_clock_t final : wall_clock_t {
    pt::ptime now() const noexcept override;
};

SYNCSCHED_API wall_clock_ptr_t make_system_clock() noexcept;

using day_filter_t = std::function<bool(const gr::date &)>;

/** \struct schedule_t
 *  \brief daily `HH:MM` job restricted to the days accepted by the filter */
struct SYNCSCHED_API schedule_t {
    static constexpr std::uint32_t look_ahead_days = 30;

    schedule_t(pt::time_duration at, day_filter_t filter = {}) noexcept;

    /** the first fire time strictly after `now`, none if no day within look-ahead is accepted */
    std::optional<pt::ptime> next_fire(const pt::ptime &now) const noexcept;

    inline const pt::time_duration &get_time() const noexcept { return at; }

  private:
    pt::time_duration at;
    day_filter_t filter;
};

SYNCSCHED_API bool is_weekday(const gr::date &date) noexcept;

SYNCSCHED_API day_filter_t make_filter(config::frequency_t frequency) noexcept;

} // namespace syncsched::core
