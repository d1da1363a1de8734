// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "partition.h"
#include "utils/time.h"

namespace syncsched::model {

partition_t partition_t::all_history() noexcept { return partition_t(); }

partition_t::partition_t(const gr::date &date_) noexcept : date{date_} {}

std::string partition_t::key() const noexcept {
    if (!date) {
        return "all";
    }
    return utils::format_date(*date);
}

bool partition_t::operator<(const partition_t &other) const noexcept {
    if (!date) {
        return other.date.has_value();
    }
    return other.date && *date < *other.date;
}

} // namespace syncsched::model
