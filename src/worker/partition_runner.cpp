// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "partition_runner.h"
#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <vector>

namespace syncsched::worker {

std::uint32_t compute_partition_concurrency(std::uint32_t rate_limit, std::uint32_t est_call_ms,
                                            std::uint32_t max) noexcept {
    auto value = static_cast<std::uint64_t>(rate_limit) * est_call_ms / 60000;
    auto upper = std::max<std::uint64_t>(max, 1);
    return static_cast<std::uint32_t>(std::clamp<std::uint64_t>(value, 1, upper));
}

partition_runner_t::partition_runner_t(runner_config_t config_) noexcept : config{std::move(config_)} {
    log = utils::get_logger("worker.runner");
}

std::uint32_t partition_runner_t::concurrency_for(const model::unit_t &unit) const noexcept {
    return compute_partition_concurrency(unit.get_rate_limit(), config.est_call_ms, config.max_concurrency);
}

void partition_runner_t::sleep(std::chrono::milliseconds value) noexcept {
    if (config.sleeper) {
        config.sleeper(value);
    } else {
        std::this_thread::sleep_for(value);
    }
}

std::thread partition_runner_t::spawn(std::function<void()> fn) {
    if (config.spawner) {
        return config.spawner(std::move(fn));
    }
    return std::thread(std::move(fn));
}

void partition_runner_t::run_partition(model::task_t &task, const model::partition_t &partition) noexcept {
    auto &unit = task.get_unit();
    auto name = unit.get_name();
    auto key = partition.key();
    auto max_calls = config.retry_attempts + 1;
    for (std::uint32_t attempt = 1;; ++attempt) {
        auto result = unit.get_fetcher().run(name, partition);
        if (!result.error) {
            LOG_TRACE(log, "task {}, {}/{}: {} rows written", task.get_id(), name, key, result.rows_written);
            task.record_success(result.rows_written);
            return;
        }
        auto &message = *result.error;
        if (result.transient && attempt < max_calls && !task.is_cancel_requested()) {
            auto factor = std::int64_t{1} << std::min<std::uint32_t>(attempt - 1, 30);
            auto delay = std::chrono::milliseconds(config.retry_backoff_ms * factor);
            LOG_DEBUG(log, "task {}, {}/{}: transient failure '{}' (attempt {}), retrying in {}ms", task.get_id(),
                      name, key, message, attempt, delay.count());
            sleep(delay);
            continue;
        }
        LOG_WARN(log, "task {}, {}/{}: {} failure '{}' after {} attempt(s)", task.get_id(), name, key,
                 result.transient ? "transient" : "permanent", message, attempt);
        task.record_failure(model::partition_error_t{std::move(key), message, result.transient, attempt});
        return;
    }
}

model::task_status_t partition_runner_t::run(model::task_t &task) noexcept {
    auto &partitions = task.get_partitions();
    auto total = partitions.size();
    auto m = std::min<std::size_t>(concurrency_for(task.get_unit()), total);
    LOG_DEBUG(log, "task {} ({}), running {} partition(s), concurrency: {}", task.get_id(), task.get_unit().get_name(),
              total, m);

    std::atomic_size_t next{0};
    auto loop = [&]() {
        while (true) {
            if (task.is_cancel_requested()) {
                return;
            }
            auto index = next.fetch_add(1, std::memory_order_acq_rel);
            if (index >= total) {
                return;
            }
            run_partition(task, partitions[index]);
        }
    };

    if (m <= 1) {
        loop();
    } else {
        auto threads = std::vector<std::thread>();
        threads.reserve(m - 1);
        for (std::size_t i = 1; i < m; ++i) {
            try {
                threads.emplace_back(spawn(loop));
            } catch (const std::system_error &ex) {
                LOG_WARN(log, "task {}, cannot start partition thread ({}), continuing with {} thread(s)",
                         task.get_id(), ex.what(), threads.size() + 1);
                break;
            }
        }
        loop();
        for (auto &t : threads) {
            t.join();
        }
    }

    auto status = task.resolve_status();
    LOG_DEBUG(log, "task {} ({}) resolved as {}, processed: {}/{}, errors: {}", task.get_id(),
              task.get_unit().get_name(), model::to_string(status), task.get_processed(), total,
              task.get_errors_count());
    return status;
}

} // namespace syncsched::worker
