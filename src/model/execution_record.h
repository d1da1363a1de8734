// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/outcome.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "syncsched-export.h"

namespace syncsched::model {

namespace outcome = boost::outcome_v2;
namespace pt = boost::posix_time;

using task_id_t = std::uint64_t;

enum class task_kind_t { full, incremental, backfill };
enum class task_status_t { pending, running, completed, failed, cancelled };
enum class trigger_t { manual, scheduled, dependency };

SYNCSCHED_API std::string_view to_string(task_kind_t value) noexcept;
SYNCSCHED_API std::string_view to_string(task_status_t value) noexcept;
SYNCSCHED_API std::string_view to_string(trigger_t value) noexcept;

SYNCSCHED_API std::optional<task_kind_t> task_kind_from_string(std::string_view value) noexcept;
SYNCSCHED_API std::optional<task_status_t> task_status_from_string(std::string_view value) noexcept;
SYNCSCHED_API std::optional<trigger_t> trigger_from_string(std::string_view value) noexcept;

inline bool is_terminal(task_status_t status) noexcept {
    return status == task_status_t::completed || status == task_status_t::failed ||
           status == task_status_t::cancelled;
}

struct partition_error_t {
    std::string partition;
    std::string message;
    bool transient = false;
    std::uint32_t attempts = 1;
};

using partition_errors_t = std::vector<partition_error_t>;

/** \struct execution_record_t
 *  \brief durable projection of a task, also used as task status snapshot
 */
struct SYNCSCHED_API execution_record_t {
    task_id_t id = 0;
    std::string unit;
    task_kind_t kind = task_kind_t::incremental;
    trigger_t trigger = trigger_t::manual;
    task_status_t status = task_status_t::pending;
    std::vector<std::string> partitions;
    std::size_t total = 0;
    std::size_t processed = 0;
    std::int64_t rows_written = 0;
    partition_errors_t errors;
    pt::ptime created_at;
    pt::ptime started_at;
    pt::ptime completed_at;
    std::string failure_reason;

    /** `0.0 .. 1.0` */
    double progress() const noexcept;

    std::string serialize() const noexcept;
    static outcome::result<execution_record_t> deserialize(std::string_view data) noexcept;
};

using execution_records_t = std::vector<execution_record_t>;

} // namespace syncsched::model
