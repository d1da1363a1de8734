// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/db.h"
#include "db/history_store.h"
#include "messages.h"
#include "utils/log.h"
#include "syncsched-export.h"

#include <rotor.hpp>
#include <memory>

namespace syncsched::core {

namespace bfs = std::filesystem;

struct history_actor_config_t : r::actor_config_t {
    bfs::path db_dir;
    config::db_config_t db_config;
};

template <typename Actor> struct history_actor_config_builder_t : r::actor_config_builder_t<Actor> {
    using builder_t = typename Actor::template config_builder_t<Actor>;
    using parent_t = r::actor_config_builder_t<Actor>;
    using parent_t::parent_t;

    builder_t &&db_dir(const bfs::path &value) && noexcept {
        parent_t::config.db_dir = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }

    builder_t &&db_config(const config::db_config_t &value) && noexcept {
        parent_t::config.db_config = value;
        return std::move(*static_cast<typename parent_t::builder_t *>(this));
    }
};

/** \struct history_actor_t
 *  \brief the only owner of the execution history database */
struct SYNCSCHED_API history_actor_t : public r::actor_base_t {
    using config_t = history_actor_config_t;
    template <typename Actor> using config_builder_t = history_actor_config_builder_t<Actor>;

    explicit history_actor_t(config_t &cfg);

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;
    void on_start() noexcept override;
    void shutdown_finish() noexcept override;

  private:
    void open() noexcept;
    void on_record(message::record_t &message) noexcept;
    void on_query(message::history_query_request_t &req) noexcept;
    void on_cleanup(message::history_cleanup_request_t &req) noexcept;

    utils::logger_t log;
    std::unique_ptr<db::history_store_t> store;
};

} // namespace syncsched::core
