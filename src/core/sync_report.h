// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "model/backfill_policy.h"
#include "model/execution_record.h"
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "syncsched-export.h"

namespace syncsched::core {

namespace pt = boost::posix_time;

enum class error_type_t {
    none,
    rate_limit,
    timeout,
    connection,
    authentication,
    data_not_found,
    resource_exhaustion,
    execution_error,
};

SYNCSCHED_API std::string_view to_string(error_type_t value) noexcept;

/** case-insensitive keyword based classification of a failure message */
SYNCSCHED_API error_type_t classify_error(std::string_view message) noexcept;

enum class unit_outcome_t {
    planned,
    submitted,
    completed,
    failed,
    skipped_dependency,
    skipped_alert,
    cancelled,
};

SYNCSCHED_API std::string_view to_string(unit_outcome_t value) noexcept;

enum class run_status_t { running, completed, stopped };

SYNCSCHED_API std::string_view to_string(run_status_t value) noexcept;

struct unit_report_t {
    std::string unit;
    unit_outcome_t outcome = unit_outcome_t::planned;
    std::optional<model::decision_t> decision;
    std::optional<model::task_id_t> task_id;
    std::size_t partitions = 0;
    std::size_t missing_count = 0;
    std::int64_t rows_written = 0;
    std::string error;
    error_type_t error_type = error_type_t::none;
};

/** \struct sync_report_t
 *  \brief outcome of a single sync plan run
 */
struct SYNCSCHED_API sync_report_t {
    using names_t = std::vector<std::string>;

    std::uint64_t run_id = 0;
    model::trigger_t trigger = model::trigger_t::scheduled;
    pt::ptime started_at;
    pt::ptime finished_at;
    run_status_t status = run_status_t::running;
    std::vector<unit_report_t> units;

    unit_report_t *find(std::string_view unit) noexcept;
    const unit_report_t *find(std::string_view unit) const noexcept;

    std::size_t count(unit_outcome_t outcome) const noexcept;

    /** units to rerun via retry: failed, not submitted due to dependency, cancelled */
    names_t failed_units() const noexcept;

    /** records the terminal task state into the unit report */
    void apply(const model::execution_record_t &record) noexcept;
};

} // namespace syncsched::core
