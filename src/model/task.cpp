// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "task.h"

namespace syncsched::model {

task_t::task_t(task_id_t id_, unit_ptr_t unit_, task_kind_t kind_, trigger_t trigger_, partitions_t partitions_,
               const pt::ptime &created_at_) noexcept
    : id{id_}, unit{std::move(unit_)}, kind{kind_}, trigger{trigger_}, partitions{std::move(partitions_)},
      status{task_status_t::pending}, processed{0}, succeeded{0}, rows_written{0}, cancel_requested{false},
      created_at{created_at_} {}

bool task_t::is_terminal() const noexcept { return model::is_terminal(get_status()); }

std::size_t task_t::get_errors_count() const noexcept {
    auto lock = std::lock_guard(mutex);
    return errors.size();
}

void task_t::mark_running(const pt::ptime &at) noexcept {
    auto lock = std::lock_guard(mutex);
    started_at = at;
    status.store(task_status_t::running, std::memory_order_release);
}

bool task_t::finish(task_status_t status_, const pt::ptime &at, std::string reason) noexcept {
    auto lock = std::lock_guard(mutex);
    if (model::is_terminal(status.load(std::memory_order_acquire))) {
        return false;
    }
    completed_at = at;
    failure_reason = std::move(reason);
    status.store(status_, std::memory_order_release);
    return true;
}

task_status_t task_t::resolve_status() const noexcept {
    auto total = partitions.size();
    auto done = processed.load(std::memory_order_acquire);
    if (done < total && cancel_requested.load(std::memory_order_acquire)) {
        return task_status_t::cancelled;
    }
    if (total && succeeded.load(std::memory_order_acquire) == 0) {
        return task_status_t::failed;
    }
    return task_status_t::completed;
}

void task_t::record_success(std::int64_t rows) noexcept {
    rows_written.fetch_add(rows, std::memory_order_acq_rel);
    succeeded.fetch_add(1, std::memory_order_acq_rel);
    processed.fetch_add(1, std::memory_order_acq_rel);
}

void task_t::record_failure(partition_error_t error) noexcept {
    {
        auto lock = std::lock_guard(mutex);
        errors.emplace_back(std::move(error));
    }
    processed.fetch_add(1, std::memory_order_acq_rel);
}

execution_record_t task_t::make_record() const noexcept {
    auto lock = std::lock_guard(mutex);
    auto r = execution_record_t{};
    r.id = id;
    r.unit = std::string(unit->get_name());
    r.kind = kind;
    r.trigger = trigger;
    r.status = get_status();
    r.partitions.reserve(partitions.size());
    for (auto &p : partitions) {
        r.partitions.emplace_back(p.key());
    }
    r.total = partitions.size();
    r.processed = get_processed();
    r.rows_written = get_rows_written();
    r.errors = errors;
    r.created_at = created_at;
    r.started_at = started_at;
    r.completed_at = completed_at;
    r.failure_reason = failure_reason;
    return r;
}

} // namespace syncsched::model
