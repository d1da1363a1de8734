// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <optional>
#include <string>
#include <vector>
#include "syncsched-export.h"

namespace syncsched::model {

namespace gr = boost::gregorian;

/** \struct partition_t
 *  \brief the smallest independently retryable slice of a task
 *
 * A partition is either a single date or the "all history" marker
 * used by full tasks.
 */
struct SYNCSCHED_API partition_t {
    static partition_t all_history() noexcept;

    explicit partition_t(const gr::date &date) noexcept;

    inline bool is_all_history() const noexcept { return !date; }
    inline const gr::date &get_date() const noexcept { return *date; }

    /** `YYYYMMDD` or `all` */
    std::string key() const noexcept;

    bool operator==(const partition_t &other) const noexcept { return date == other.date; }
    bool operator!=(const partition_t &other) const noexcept { return date != other.date; }
    bool operator<(const partition_t &other) const noexcept;

  private:
    partition_t() noexcept = default;
    std::optional<gr::date> date;
};

using partitions_t = std::vector<partition_t>;
using dates_t = std::vector<gr::date>;

} // namespace syncsched::model
