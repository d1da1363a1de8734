// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "model/task.h"
#include "utils/log.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>
#include "syncsched-export.h"

namespace syncsched::worker {

using sleeper_t = std::function<void(std::chrono::milliseconds)>;
using spawner_t = std::function<std::thread(std::function<void()>)>;

struct runner_config_t {
    /** per-task partitions concurrency cap */
    std::uint32_t max_concurrency = 10;
    /** estimated duration of a single upstream call */
    std::uint32_t est_call_ms = 1000;
    /** retries of transient failures, i.e. up to `retry_attempts + 1` calls */
    std::uint32_t retry_attempts = 3;
    std::uint32_t retry_backoff_ms = 1000;
    /** std::this_thread::sleep_for when empty */
    sleeper_t sleeper;
    /** plain std::thread when empty, may throw std::system_error */
    spawner_t spawner;
};

/** M = clamp(floor(rate_limit * est_call_ms / 60000), 1, max) */
SYNCSCHED_API std::uint32_t compute_partition_concurrency(std::uint32_t rate_limit, std::uint32_t est_call_ms,
                                                          std::uint32_t max) noexcept;

/** \struct partition_runner_t
 *  \brief executes the partitions of a single task with bounded fan-out
 *
 * At most M partitions are fetched concurrently. A failed partition is
 * recorded in the task and does not stop the remaining ones; transient
 * failures are retried with exponential backoff. The cancel flag of the
 * task is consulted before every partition, partitions already in flight
 * are never interrupted.
 *
 * If a fan-out thread cannot be started, the task goes on with the threads
 * already started (the calling thread included).
 *
 * The call blocks until all started partitions resolve.
 */
struct SYNCSCHED_API partition_runner_t {
    explicit partition_runner_t(runner_config_t config) noexcept;

    /** returns the resolved terminal status, the task status itself is not changed */
    model::task_status_t run(model::task_t &task) noexcept;

    std::uint32_t concurrency_for(const model::unit_t &unit) const noexcept;

  private:
    void run_partition(model::task_t &task, const model::partition_t &partition) noexcept;
    void sleep(std::chrono::milliseconds value) noexcept;
    std::thread spawn(std::function<void()> fn);

    runner_config_t config;
    utils::logger_t log;
};

} // namespace syncsched::worker
