// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "partition_runner.h"
#include "utils/log.h"
#include "syncsched-export.h"

#include <rotor/thread.hpp>

namespace syncsched {
namespace worker {

namespace r = rotor;
namespace rth = rotor::thread;

struct worker_supervisor_config_t : r::supervisor_config_t {
    uint32_t index;
    runner_config_t runner;
};

template <typename Supervisor> struct worker_supervisor_config_builder_t : r::supervisor_config_builder_t<Supervisor> {
    using builder_t = typename Supervisor::template config_builder_t<Supervisor>;
    using parent_t = r::supervisor_config_builder_t<Supervisor>;
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

struct SYNCSCHED_API worker_supervisor_t : rth::supervisor_thread_t {
    using parent_t = rth::supervisor_thread_t;
    using config_t = worker_supervisor_config_t;
    template <typename Supervisor> using config_builder_t = worker_supervisor_config_builder_t<Supervisor>;

    worker_supervisor_t(config_t &config);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;

  private:
    void launch() noexcept;

    uint32_t index;
    runner_config_t runner;
    utils::logger_t log;
};

} // namespace worker
} // namespace syncsched
