// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "utils/log.h"
#include "messages.h"
#include "partition_runner.h"
#include "syncsched-export.h"

#include <rotor.hpp>

namespace syncsched {
namespace worker {

struct worker_actor_config_t : r::actor_config_t {
    uint32_t index;
    runner_config_t runner;
};

template <typename Actor> struct worker_actor_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&index(uint32_t value) && noexcept {
        parent_t::config.index = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&runner(runner_config_t value) && noexcept {
        parent_t::config.runner = std::move(value);
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/** \struct worker_actor_t
 *  \brief executes one task at a time, the thread is blocked for the task duration */
struct SYNCSCHED_API worker_actor_t : public r::actor_base_t {
    using config_t = worker_actor_config_t;
    template <typename Actor> using config_builder_t = worker_actor_config_builder_t<Actor>;

    explicit worker_actor_t(config_t &cfg);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void shutdown_finish() noexcept override;

  private:
    void on_execute(message::execute_t &req) noexcept;

    utils::logger_t log;
    uint32_t index;
    partition_runner_t runner;
};

} // namespace worker
} // namespace syncsched
