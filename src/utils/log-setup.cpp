// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "log-setup.h"

#include "error_code.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <unordered_map>
#include <string_view>
#include <vector>

namespace syncsched::utils {

static const char *log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%L/%t%$] {%n} %v";

using sink_option_t = outcome::result<spdlog::sink_ptr>;

static sink_option_t make_sink(std::string_view name) noexcept {
    if (name == "stdout") {
        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else if (name == "stderr") {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else if (name.size() > 5 && name.substr(0, 5) == "file:") {
        auto path = std::string(name.substr(5));
        try {
            return std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        } catch (const spdlog::spdlog_ex &ex) {
            spdlog::error("cannot open log file '{}': {}", path, ex.what());
            return utils::make_error_code(error_code_t::unknown_sink);
        }
    }
    return utils::make_error_code(error_code_t::unknown_sink);
}

void set_default(std::string_view level) noexcept {
    auto value = get_log_level(level).value_or(spdlog::level::info);
    spdlog::default_logger()->set_level(value);
}

outcome::result<void> init_loggers(const config::log_configs_t &configs, bool overwrite_default) noexcept {
    using sink_map_t = std::unordered_map<std::string, spdlog::sink_ptr>;
    using logger_map_t = std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

    auto prev = spdlog::default_logger();
    if (prev->sinks().size() != 1) {
        return utils::make_error_code(error_code_t::misconfigured_default_logger);
    }
    auto prev_sink = prev->sinks().front();
    auto dist_sink = dynamic_cast<spdlog::sinks::dist_sink_mt *>(prev_sink.get());
    if (!dist_sink) {
        return utils::make_error_code(error_code_t::misconfigured_default_logger);
    }

    spdlog::drop_all();
    spdlog::set_default_logger(prev);

    sink_map_t sink_map;
    for (auto &cfg : configs) {
        for (auto &sink : cfg.sinks) {
            if (sink_map.count(sink)) {
                continue;
            }
            auto sink_option = make_sink(sink);
            if (!sink_option) {
                return sink_option.error();
            }
            sink_map[sink] = sink_option.value();
        }
    }

    logger_map_t logger_map;
    auto root_level = prev->level();
    bool has_default = false;
    for (auto &cfg : configs) {
        if (cfg.name != "default") {
            continue;
        }
        has_default = true;
        for (auto &sink_name : cfg.sinks) {
            dist_sink->add_sink(sink_map.at(sink_name));
        }
        if (!overwrite_default) {
            prev->set_level(cfg.level);
            root_level = cfg.level;
        }
        if (root_level == spdlog::level::trace) {
            prev->flush_on(spdlog::level::trace);
        }
    }

    if (!has_default && dist_sink->sinks().empty()) {
        dist_sink->add_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    for (auto &cfg : configs) {
        auto &name = cfg.name;
        if (name == "default") {
            continue;
        }

        std::vector<spdlog::sink_ptr> sinks;
        for (auto &sink_name : cfg.sinks) {
            sinks.push_back(sink_map.at(sink_name));
        }
        if (sinks.empty()) {
            sinks = prev->sinks();
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(std::max(cfg.level, root_level));
        logger_map[name] = logger;
    }

    for (auto &it : logger_map) {
        spdlog::register_logger(it.second);
    }
    spdlog::set_pattern(log_pattern);
    return outcome::success();
}

dist_sink_t create_root_logger() noexcept {
    auto dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("", dist_sink);
    logger->set_level(spdlog::level::trace);
    spdlog::drop_all();
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(log_pattern);
    spdlog::set_level(spdlog::level::trace);
    return dist_sink;
}

} // namespace syncsched::utils
