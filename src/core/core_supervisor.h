// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/main.h"
#include "model/registry.h"
#include "model/trade_calendar.h"
#include "schedule.h"
#include "utils/log.h"
#include "syncsched-export.h"
#include <rotor/asio.hpp>

namespace syncsched::core {

namespace r = rotor;
namespace ra = rotor::asio;

struct core_supervisor_config_t : ra::supervisor_config_asio_t {
    config::main_t app_config;
    model::registry_ptr_t registry;
    model::trade_calendar_ptr_t calendar;
    wall_clock_ptr_t clock;
};

template <typename Supervisor>
struct core_supervisor_config_builder_t : ra::supervisor_config_asio_builder_t<Supervisor> {
    using builder_t = typename Supervisor::template config_builder_t<Supervisor>;
    using parent_t = ra::supervisor_config_asio_builder_t<Supervisor>;
    using parent_t::parent_t;

    builder_t &&app_config(const config::main_t &value) && noexcept {
        parent_t::config.app_config = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&registry(const model::registry_ptr_t &value) && noexcept {
        parent_t::config.registry = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&calendar(const model::trade_calendar_ptr_t &value) && noexcept {
        parent_t::config.calendar = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&clock(const wall_clock_ptr_t &value) && noexcept {
        parent_t::config.clock = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/** \struct core_supervisor_t
 *  \brief owns the history, detector, engine and scheduler actors
 *
 * A failure of any of the children shuts the whole supervisor down.
 */
struct SYNCSCHED_API core_supervisor_t : ra::supervisor_asio_t {
    using parent_t = ra::supervisor_asio_t;
    using config_t = core_supervisor_config_t;
    template <typename Actor> using config_builder_t = core_supervisor_config_builder_t<Actor>;

    explicit core_supervisor_t(config_t &config);
    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void on_child_shutdown(actor_base_t *actor) noexcept override;
    void shutdown_finish() noexcept override;

  private:
    void launch() noexcept;

    utils::logger_t log;
    config::main_t app_config;
    model::registry_ptr_t registry;
    model::trade_calendar_ptr_t calendar;
    wall_clock_ptr_t clock;
};

} // namespace syncsched::core
