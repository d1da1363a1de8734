// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "messages.h"
#include "model/registry.h"
#include "model/trade_calendar.h"
#include "utils/log.h"
#include "syncsched-export.h"

#include <rotor.hpp>

namespace syncsched::core {

struct detector_actor_config_t : r::actor_config_t {
    model::registry_ptr_t registry;
    model::trade_calendar_ptr_t calendar;
};

template <typename Actor> struct detector_actor_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&registry(const model::registry_ptr_t &value) && noexcept {
        parent_t::config.registry = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&calendar(const model::trade_calendar_ptr_t &value) && noexcept {
        parent_t::config.calendar = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/** \struct detector_actor_t
 *  \brief runs missing data detection and owns the trade calendar refreshes */
struct SYNCSCHED_API detector_actor_t : public r::actor_base_t {
    using config_t = detector_actor_config_t;
    template <typename Actor> using config_builder_t = detector_actor_config_builder_t<Actor>;

    explicit detector_actor_t(config_t &cfg);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void shutdown_finish() noexcept override;

  private:
    void on_detect(message::detect_request_t &req) noexcept;
    void on_refresh(message::refresh_calendar_t &) noexcept;

    utils::logger_t log;
    model::registry_ptr_t registry;
    model::trade_calendar_ptr_t calendar;
};

} // namespace syncsched::core
