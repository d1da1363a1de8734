// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025-2026 Ivan Baidakou

#pragma once

#include "worker/messages.h"
#include "worker/partition_runner.h"
#include "model/misc/arc.hpp"
#include "utils/log.h"

#include "syncsched-test-export.h"
#include <deque>

namespace syncsched::test {

namespace r = rotor;

struct managed_worker_config_t : r::actor_config_t {
    uint32_t index;
    bool auto_reply = true;
};

template <typename Actor> struct worker_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&index(uint32_t value) && noexcept {
        parent_t::config.index = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&auto_reply(bool value = true) && noexcept {
        parent_t::config.auto_reply = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/** \struct managed_worker_t
 *  \brief in-thread replacement of the worker actor, tasks are executed on demand
 */
struct SYNCSCHED_TEST_API managed_worker_t : r::actor_base_t {
    using config_t = managed_worker_config_t;
    template <typename Actor> using config_builder_t = worker_config_builder_t<Actor>;

    using execute_t = worker::message::execute_t;
    using execute_ptr_t = model::intrusive_ptr_t<execute_t>;
    using execute_queue_t = std::deque<execute_ptr_t>;

    managed_worker_t(config_t &cfg);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_execute(execute_t &req) noexcept;

    /** executes all queued tasks, returns the number of executed ones */
    std::size_t process() noexcept;

    /** replies for the first queued task with the given status, without executing it */
    void complete_front(model::task_status_t status) noexcept;

    uint32_t index;
    bool auto_reply;
    std::size_t executed = 0;
    utils::logger_t log;
    worker::partition_runner_t runner;
    execute_queue_t queue;
};

} // namespace syncsched::test
