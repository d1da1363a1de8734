// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/db.h"
#include "model/execution_record.h"
#include "utils/log.h"
#include <boost/outcome.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include "mdbx.h"
#include "syncsched-export.h"

namespace syncsched::db {

namespace outcome = boost::outcome_v2;
namespace bfs = std::filesystem;
namespace pt = boost::posix_time;

enum class sort_t { completed_desc, completed_asc, unit, status };

struct history_filter_t {
    std::optional<std::string> unit;
    std::optional<model::task_status_t> status;
    std::optional<model::task_kind_t> kind;
    std::optional<model::trigger_t> trigger;
    /** inclusive completion time bounds, not-a-date-time for unbounded */
    pt::ptime completed_from;
    pt::ptime completed_to;

    bool matches(const model::execution_record_t &record) const noexcept;
};

struct history_query_t {
    history_filter_t filter;
    sort_t sort = sort_t::completed_desc;
    std::size_t offset = 0;
    std::size_t limit = 50;
};

struct history_page_t {
    model::execution_records_t records;
    /** number of records matching the filter */
    std::size_t total = 0;
};

/** \struct history_store_t
 *  \brief append-only persistent store of execution records
 *
 * Only `cleanup_older_than` removes records.
 */
struct SYNCSCHED_API history_store_t {
    static const std::uint32_t version;

    history_store_t(bfs::path db_dir, config::db_config_t config) noexcept;
    history_store_t(const history_store_t &) = delete;
    ~history_store_t();

    outcome::result<void> open() noexcept;
    inline bool is_open() const noexcept { return env != nullptr; }

    outcome::result<void> record(const model::execution_record_t &record) noexcept;
    outcome::result<history_page_t> query(const history_query_t &query) noexcept;

    /** removes records completed before `now - days`, returns number of removed records */
    outcome::result<std::size_t> cleanup_older_than(std::uint32_t days, const pt::ptime &now) noexcept;

    outcome::result<std::uint32_t> get_version() noexcept;

  private:
    bfs::path db_dir;
    config::db_config_t config;
    MDBX_env *env = nullptr;
    utils::logger_t log;
};

} // namespace syncsched::db
