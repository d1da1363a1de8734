// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "log.h"
#include <boost/algorithm/string/predicate.hpp>
#include <array>
#include <utility>

namespace syncsched::utils {

namespace {

using level_name_t = std::pair<std::string_view, spdlog::level::level_enum>;

// the first name of a level is the canonical one
constexpr std::array<level_name_t, 10> level_names = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"crit", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

} // namespace

auto get_log_level(std::string_view log_level) noexcept -> level_opt_t {
    for (auto &[name, level] : level_names) {
        if (boost::algorithm::iequals(name, log_level)) {
            return level;
        }
    }
    return {};
}

std::string_view get_level_string(spdlog::level::level_enum level) noexcept {
    for (auto &[name, value] : level_names) {
        if (value == level) {
            return name;
        }
    }
    return "off";
}

logger_t get_logger(std::string_view name) noexcept {
    auto result = spdlog::get(std::string(name));
    if (result) {
        return result;
    }

    // "scheduler.engine" inherits "scheduler", then the default logger
    auto parent = logger_t();
    for (auto prefix = name; !parent;) {
        auto p = prefix.rfind('.');
        if (p == prefix.npos) {
            parent = spdlog::default_logger();
        } else {
            prefix = prefix.substr(0, p);
            parent = spdlog::get(std::string(prefix));
        }
    }

    auto &sinks = parent->sinks();
    result = std::make_shared<spdlog::logger>(std::string(name), sinks.begin(), sinks.end());
    result->set_level(parent->level());
    spdlog::register_logger(result);
    return result;
}

} // namespace syncsched::utils
