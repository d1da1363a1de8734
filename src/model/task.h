// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "unit.h"
#include "execution_record.h"
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include "syncsched-export.h"

namespace syncsched::model {

namespace pt = boost::posix_time;

struct task_t;
using task_ptr_t = intrusive_ptr_t<task_t>;

/** \struct task_t
 *  \brief one execution attempt against one unit
 *
 * The status is `pending -> running -> {completed | failed | cancelled}`,
 * terminal statuses are final. The task is mutated by the engine actor
 * (status transitions) and by the partition runner threads (progress,
 * errors), hence progress counters are atomic and the error list is
 * guarded. Status queries take a consistent copy via `make_record`.
 */
struct SYNCSCHED_API task_t : arc_base_t<task_t> {
    task_t(task_id_t id, unit_ptr_t unit, task_kind_t kind, trigger_t trigger, partitions_t partitions,
           const pt::ptime &created_at) noexcept;

    inline task_id_t get_id() const noexcept { return id; }
    inline unit_t &get_unit() const noexcept { return *unit; }
    inline const unit_ptr_t &get_unit_ptr() const noexcept { return unit; }
    inline task_kind_t get_kind() const noexcept { return kind; }
    inline trigger_t get_trigger() const noexcept { return trigger; }
    inline const partitions_t &get_partitions() const noexcept { return partitions; }

    inline task_status_t get_status() const noexcept { return status.load(std::memory_order_acquire); }
    bool is_terminal() const noexcept;

    inline std::size_t get_processed() const noexcept { return processed.load(std::memory_order_acquire); }
    inline std::int64_t get_rows_written() const noexcept { return rows_written.load(std::memory_order_acquire); }
    std::size_t get_errors_count() const noexcept;

    void mark_running(const pt::ptime &at) noexcept;

    /** finalizes the task, returns false if it was already terminal */
    bool finish(task_status_t status, const pt::ptime &at, std::string reason = {}) noexcept;

    /** computes the terminal status from the partitions outcomes */
    task_status_t resolve_status() const noexcept;

    void record_success(std::int64_t rows) noexcept;
    void record_failure(partition_error_t error) noexcept;

    inline void request_cancel() noexcept { cancel_requested.store(true, std::memory_order_release); }
    inline bool is_cancel_requested() const noexcept { return cancel_requested.load(std::memory_order_acquire); }

    execution_record_t make_record() const noexcept;

  private:
    task_id_t id;
    unit_ptr_t unit;
    task_kind_t kind;
    trigger_t trigger;
    partitions_t partitions;

    std::atomic<task_status_t> status;
    std::atomic_size_t processed;
    std::atomic_size_t succeeded;
    std::atomic<std::int64_t> rows_written;
    std::atomic_bool cancel_requested;

    mutable std::mutex mutex;
    partition_errors_t errors;
    pt::ptime created_at;
    pt::ptime started_at;
    pt::ptime completed_at;
    std::string failure_reason;
};

} // namespace syncsched::model
