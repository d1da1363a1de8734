// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "backfill_policy.h"
#include <algorithm>

namespace syncsched::model {

std::string_view to_string(decision_t value) noexcept {
    switch (value) {
    case decision_t::incremental:
        return "incremental";
    case decision_t::backfill:
        return "backfill";
    default:
        return "skip_alert";
    }
}

task_shape_t backfill_policy_t::decide(const dates_t &missing, const gr::date &today) const noexcept {
    auto count = missing.size();
    if (count == 0) {
        return task_shape_t{decision_t::incremental, task_kind_t::incremental, {partition_t(today)}, 0};
    }
    if (count > threshold) {
        return task_shape_t{decision_t::skip_alert, task_kind_t::backfill, {}, count};
    }

    auto dates = missing;
    dates.emplace_back(today);
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());

    auto partitions = partitions_t();
    partitions.reserve(dates.size());
    for (auto &d : dates) {
        partitions.emplace_back(d);
    }
    return task_shape_t{decision_t::backfill, task_kind_t::backfill, std::move(partitions), count};
}

} // namespace syncsched::model
