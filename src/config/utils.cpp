// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "utils.h"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include "utils/log.h"
#include "utils/location.h"
#include "utils/time.h"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.h>

#define SAFE_GET_VALUE(property, type, table_name)                                                                     \
    {                                                                                                                  \
        auto option = t[#property].value<type>();                                                                      \
        if (!option) {                                                                                                 \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = option.value();                                                                               \
        }                                                                                                              \
    }

#define SAFE_GET_PATH_EXPANDED(property, table_name)                                                                   \
    {                                                                                                                  \
        auto option = t[#property].value<std::string>();                                                               \
        if (!option) {                                                                                                 \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = utils::expand_home(option.value(), home_opt);                                                 \
        }                                                                                                              \
    }

#define SAFE_GET_TIME(property, table_name)                                                                            \
    {                                                                                                                  \
        auto option = t[#property].value<std::string>();                                                               \
        auto parsed = utils::parse_time_of_day(option.value_or(""));                                                   \
        if (!parsed) {                                                                                                 \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = parsed.value();                                                                               \
        }                                                                                                              \
    }

namespace syncsched::config {

namespace pt = boost::posix_time;
namespace sys = boost::system;

using level_t = spdlog::level::level_enum;

static const std::string home_path = "~/.config/syncsched";

static unit_config_t::names_t get_names(const toml::node_view<toml::node> &node) noexcept {
    unit_config_t::names_t r;
    if (auto arr = node.as_array(); arr) {
        for (auto &it : *arr) {
            if (auto value = it.value<std::string>(); value) {
                r.emplace_back(std::move(value.value()));
            }
        }
    }
    return r;
}

static main_t make_default_config(const bfs::path &config_path, bool is_home) {
    auto dir = is_home ? bfs::path(home_path) : config_path.parent_path();

    // clang-format off
    main_t cfg;
    cfg.config_path = config_path;
    cfg.db_dir = dir / "history";
    cfg.calendar_file = dir / "trade_calendar.csv";
    cfg.timeout = 5000;
    cfg.log_configs = {
        log_config_t {
            "default", spdlog::level::level_enum::info, {"stdout"}
        }
    };
    cfg.engine_config = engine_config_t {
        3,          /* concurrency, process-wide running tasks */
        3,          /* worker_threads */
        10,         /* max_partition_concurrency */
        1000,       /* est_call_ms */
        3,          /* retry_attempts */
        1000,       /* retry_backoff_ms, doubled on each attempt */
        30000,      /* shutdown_grace_ms */
        1000,       /* keep_finished */
    };
    cfg.scheduler_config = scheduler_config_t {
        true,                   /* enabled */
        pt::hours(16),          /* missing_check_time */
        pt::hours(18),          /* sync_time */
        pt::hours(3),           /* cleanup_time */
        frequency_t::daily,     /* frequency */
        true,                   /* skip_non_trading_days */
        false,                  /* include_optional_deps */
        true,                   /* smart_backfill */
        3,                      /* backfill_threshold */
        30,                     /* lookback_days */
        30,                     /* retention_days */
        "cn",                   /* market */
    };
    cfg.db_config = db_config_t {
        0x0,        /* upper_limit, auto-adjust */
    };
    // clang-format on
    return cfg;
}

std::string_view to_string(frequency_t value) noexcept {
    switch (value) {
    case frequency_t::weekdays:
        return "weekdays";
    default:
        return "daily";
    }
}

config_result_t get_config(std::istream &config, const bfs::path &config_path) {
    main_t cfg;
    cfg.config_path = config_path;

    auto home_opt = utils::get_home_dir();
    auto r = toml::parse(config);
    if (!r) {
        return std::string(r.error().description());
    }

    auto config_dir_opt = utils::get_default_config_dir();
    if (!config_dir_opt) {
        auto ec = config_dir_opt.assume_error();
        return fmt::format("cannot get config dir: {}", ec.message());
    }
    bool is_home = config_path.parent_path() == config_dir_opt.assume_value();
    auto default_config = make_default_config(config_path, is_home);

    auto &root_tbl = r.table();
    // main
    {
        auto t = root_tbl["main"];
        auto &c = cfg;
        auto &c_default = default_config;

        SAFE_GET_VALUE(timeout, std::uint32_t, "main");
        SAFE_GET_PATH_EXPANDED(db_dir, "main");
        SAFE_GET_PATH_EXPANDED(calendar_file, "main");
    }

    // log
    {
        if (auto logs = root_tbl["log"].as_array(); logs) {
            for (auto &node : *logs) {
                auto t = node.as_table();
                if (!t) {
                    return std::string("log entry should be a table");
                }
                auto name = (*t)["name"].value<std::string>();
                if (!name) {
                    return std::string("log entry should have a name");
                }
                auto level_str = (*t)["level"].value<std::string>().value_or("info");
                auto level = utils::get_log_level(level_str);
                if (!level) {
                    return fmt::format("unknown log level '{}' for '{}'", level_str, *name);
                }
                auto sinks = log_config_t::sinks_t();
                if (auto arr = (*t)["sinks"].as_array(); arr) {
                    for (auto &s : *arr) {
                        if (auto value = s.value<std::string>(); value) {
                            sinks.emplace_back(std::move(value.value()));
                        }
                    }
                }
                cfg.log_configs.emplace_back(log_config_t{std::move(*name), *level, std::move(sinks)});
            }
        } else {
            spdlog::warn("using default value for log");
            cfg.log_configs = default_config.log_configs;
        }
    }

    // engine
    {
        auto t = root_tbl["engine"];
        auto &c = cfg.engine_config;
        auto &c_default = default_config.engine_config;

        SAFE_GET_VALUE(concurrency, std::uint32_t, "engine");
        SAFE_GET_VALUE(worker_threads, std::uint32_t, "engine");
        SAFE_GET_VALUE(max_partition_concurrency, std::uint32_t, "engine");
        SAFE_GET_VALUE(est_call_ms, std::uint32_t, "engine");
        SAFE_GET_VALUE(retry_attempts, std::uint32_t, "engine");
        SAFE_GET_VALUE(retry_backoff_ms, std::uint32_t, "engine");
        SAFE_GET_VALUE(shutdown_grace_ms, std::uint32_t, "engine");
        SAFE_GET_VALUE(keep_finished, std::uint32_t, "engine");

        if (!c.worker_threads) {
            return std::string("engine/worker_threads should be positive");
        }
        if (!c.concurrency) {
            return std::string("engine/concurrency should be positive");
        }
        if (!c.max_partition_concurrency) {
            return std::string("engine/max_partition_concurrency should be positive");
        }
    }

    // scheduler
    {
        auto t = root_tbl["scheduler"];
        auto &c = cfg.scheduler_config;
        auto &c_default = default_config.scheduler_config;

        SAFE_GET_VALUE(enabled, bool, "scheduler");
        SAFE_GET_TIME(missing_check_time, "scheduler");
        SAFE_GET_TIME(sync_time, "scheduler");
        SAFE_GET_TIME(cleanup_time, "scheduler");
        SAFE_GET_VALUE(skip_non_trading_days, bool, "scheduler");
        SAFE_GET_VALUE(include_optional_deps, bool, "scheduler");
        SAFE_GET_VALUE(smart_backfill, bool, "scheduler");
        SAFE_GET_VALUE(backfill_threshold, std::uint32_t, "scheduler");
        SAFE_GET_VALUE(lookback_days, std::uint32_t, "scheduler");
        SAFE_GET_VALUE(retention_days, std::uint32_t, "scheduler");
        SAFE_GET_VALUE(market, std::string, "scheduler");

        auto frequency = t["frequency"].value<std::string>();
        if (!frequency) {
            spdlog::warn("using default value for {}/{}", "scheduler", "frequency");
            c.frequency = c_default.frequency;
        } else if (*frequency == "daily") {
            c.frequency = frequency_t::daily;
        } else if (*frequency == "weekdays" || *frequency == "weekday") {
            c.frequency = frequency_t::weekdays;
        } else {
            return fmt::format("unknown scheduler/frequency '{}'", *frequency);
        }
    }

    // db
    {
        auto t = root_tbl["db"];
        auto &c = cfg.db_config;
        auto &c_default = default_config.db_config;

        SAFE_GET_VALUE(upper_limit, std::int64_t, "db");
    }

    // units
    {
        if (auto units = root_tbl["unit"].as_array(); units) {
            for (auto &node : *units) {
                auto tbl = node.as_table();
                if (!tbl) {
                    return std::string("unit entry should be a table");
                }
                auto &t = *tbl;
                auto name = t["name"].value<std::string>();
                if (!name || name->empty()) {
                    return std::string("unit entry should have a name");
                }
                auto c = unit_config_t();
                c.name = *name;
                c.dependencies = get_names(t["dependencies"]);
                c.optional_dependencies = get_names(t["optional_dependencies"]);
                c.cadence = t["cadence"].value<std::string>().value_or("daily");
                c.enabled = t["enabled"].value<bool>().value_or(true);
                c.full_scan = t["full_scan"].value<bool>().value_or(false);
                c.rate_limit = t["rate_limit"].value<std::uint32_t>().value_or(120);
                c.fetch_cmd = t["fetch_cmd"].value<std::string>().value_or("");
                c.probe_cmd = t["probe_cmd"].value<std::string>().value_or("");
                cfg.unit_configs.emplace_back(std::move(c));
            }
        }
    }

    return cfg;
}

static toml::array as_array(const unit_config_t::names_t &names) noexcept {
    auto r = toml::array{};
    for (auto &name : names) {
        r.emplace_back<std::string>(name);
    }
    return r;
}

outcome::result<void> serialize(const main_t cfg, std::ostream &out) noexcept {
    using utils::format_time_of_day;

    auto logs = toml::array{};
    for (auto &c : cfg.log_configs) {
        auto sinks = toml::array{};
        for (auto &sink : c.sinks) {
            sinks.emplace_back<std::string>(sink);
        }
        auto log_table = toml::table{{
            {"name", c.name},
            {"level", utils::get_level_string(c.level)},
            {"sinks", sinks},
        }};
        logs.push_back(log_table);
    }

    auto units = toml::array{};
    for (auto &c : cfg.unit_configs) {
        auto unit_table = toml::table{{
            {"name", c.name},
            {"dependencies", as_array(c.dependencies)},
            {"optional_dependencies", as_array(c.optional_dependencies)},
            {"cadence", c.cadence},
            {"enabled", c.enabled},
            {"full_scan", c.full_scan},
            {"rate_limit", c.rate_limit},
            {"fetch_cmd", c.fetch_cmd},
            {"probe_cmd", c.probe_cmd},
        }};
        units.push_back(unit_table);
    }

    auto &e = cfg.engine_config;
    auto &s = cfg.scheduler_config;
    // clang-format off
    auto tbl = toml::table{{
        {"main", toml::table{{
                     {"timeout", cfg.timeout},
                     {"db_dir", cfg.db_dir.string()},
                     {"calendar_file", cfg.calendar_file.string()},
                 }}},
        {"log", logs},
        {"engine", toml::table{{
                       {"concurrency", e.concurrency},
                       {"worker_threads", e.worker_threads},
                       {"max_partition_concurrency", e.max_partition_concurrency},
                       {"est_call_ms", e.est_call_ms},
                       {"retry_attempts", e.retry_attempts},
                       {"retry_backoff_ms", e.retry_backoff_ms},
                       {"shutdown_grace_ms", e.shutdown_grace_ms},
                       {"keep_finished", e.keep_finished},
                   }}},
        {"scheduler", toml::table{{
                          {"enabled", s.enabled},
                          {"missing_check_time", format_time_of_day(s.missing_check_time)},
                          {"sync_time", format_time_of_day(s.sync_time)},
                          {"cleanup_time", format_time_of_day(s.cleanup_time)},
                          {"frequency", to_string(s.frequency)},
                          {"skip_non_trading_days", s.skip_non_trading_days},
                          {"include_optional_deps", s.include_optional_deps},
                          {"smart_backfill", s.smart_backfill},
                          {"backfill_threshold", s.backfill_threshold},
                          {"lookback_days", s.lookback_days},
                          {"retention_days", s.retention_days},
                          {"market", s.market},
                      }}},
        {"db", toml::table{{
                   {"upper_limit", cfg.db_config.upper_limit},
               }}},
    }};
    // clang-format on
    if (!units.empty()) {
        tbl.insert("unit", units);
    }
    out << tbl;
    return outcome::success();
}

outcome::result<main_t> generate_config(const bfs::path &config_path) {
    auto dir = config_path.parent_path();
    std::error_code ec;
    bool exists = bfs::exists(dir, ec);
    if (!exists) {
        spdlog::info("creating directory {}", dir.string());
        bfs::create_directories(dir, ec);
        if (ec) {
            spdlog::error("cannot create dirs: {}", ec.message());
            return sys::error_code(ec.value(), sys::generic_category());
        }
    }

    auto config_dir_opt = utils::get_default_config_dir();
    if (!config_dir_opt) {
        auto ec = config_dir_opt.assume_error();
        spdlog::warn("cannot get config dir: {}", ec.message());
        return ec;
    }
    bool is_home = dir == config_dir_opt.assume_value();
    return make_default_config(config_path, is_home);
}

} // namespace syncsched::config
