// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include <cstdint>

namespace syncsched::config {

struct engine_config_t {
    /** process-wide number of simultaneously running tasks (K) */
    std::uint32_t concurrency;
    /** number of worker threads, upper bound for concurrency */
    std::uint32_t worker_threads;
    /** cap for the per-task partition fan-out (M) */
    std::uint32_t max_partition_concurrency;
    /** estimated duration of a single partition fetch */
    std::uint32_t est_call_ms;
    std::uint32_t retry_attempts;
    std::uint32_t retry_backoff_ms;
    std::uint32_t shutdown_grace_ms;
    /** finished tasks kept in memory for status queries */
    std::uint32_t keep_finished;
};

} // namespace syncsched::config
