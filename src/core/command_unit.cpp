// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "command_unit.h"
#include "utils/error_code.h"
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <charconv>
#include <cstdio>
#include <sys/wait.h>

namespace syncsched::core {

outcome::result<command_output_t> run_command(const std::string &command) noexcept {
    auto pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        return utils::make_error_code(utils::error_code_t::command_failure);
    }
    auto output = std::string();
    char buff[256];
    while (auto n = std::fread(buff, 1, sizeof(buff), pipe)) {
        output.append(buff, n);
    }
    auto status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status)) {
        return utils::make_error_code(utils::error_code_t::command_failure);
    }
    return command_output_t{WEXITSTATUS(status), std::move(output)};
}

std::string expand_command(std::string_view pattern, std::string_view unit,
                           const model::partition_t &partition) noexcept {
    auto r = std::string(pattern);
    boost::algorithm::replace_all(r, "{unit}", std::string(unit));
    boost::algorithm::replace_all(r, "{partition}", partition.key());
    return r;
}

command_fetcher_t::command_fetcher_t(std::string pattern_) noexcept : pattern{std::move(pattern_)} {
    log = utils::get_logger("core.command");
}

model::fetch_result_t command_fetcher_t::run(std::string_view unit, const model::partition_t &partition) noexcept {
    auto command = expand_command(pattern, unit, partition);
    LOG_TRACE(log, "running '{}'", command);
    auto r = run_command(command);
    if (!r) {
        return model::fetch_result_t::failure(fmt::format("'{}': {}", command, r.assume_error().message()), true);
    }
    auto &out = r.assume_value();
    boost::algorithm::trim(out.output);
    if (out.exit_code == 0) {
        auto rows = std::int64_t{0};
        auto &s = out.output;
        std::from_chars(s.data(), s.data() + s.size(), rows);
        return model::fetch_result_t::success(rows);
    }
    auto transient = out.exit_code == transient_exit_code;
    auto message = out.output.empty() ? fmt::format("'{}' exited with code {}", command, out.exit_code)
                                      : fmt::format("{} (exit code {})", out.output, out.exit_code);
    return model::fetch_result_t::failure(std::move(message), transient);
}

command_probe_t::command_probe_t(std::string unit_, std::string pattern_) noexcept
    : unit{std::move(unit_)}, pattern{std::move(pattern_)} {
    log = utils::get_logger("core.command");
}

bool command_probe_t::has_data(const model::partition_t &partition) noexcept {
    auto command = expand_command(pattern, unit, partition);
    auto r = run_command(command);
    if (!r) {
        LOG_WARN(log, "cannot run probe '{}': {}", command, r.assume_error().message());
        return false;
    }
    return r.assume_value().exit_code == 0;
}

outcome::result<model::unit_ptr_t> make_unit(const config::unit_config_t &config) noexcept {
    auto info = model::unit_info_t{};
    info.name = config.name;
    info.dependencies = config.dependencies;
    info.optional_dependencies = config.optional_dependencies;
    info.cadence = model::cadence_from_string(config.cadence);
    info.rate_limit = config.rate_limit;
    info.enabled = config.enabled;
    info.full_scan = config.full_scan;

    // empty commands fall back to no-op fetcher and "never has data" probe
    auto fetcher = model::fetcher_ptr_t();
    auto probe = model::probe_ptr_t();
    if (!config.fetch_cmd.empty()) {
        fetcher.reset(new command_fetcher_t(config.fetch_cmd));
    }
    if (!config.probe_cmd.empty()) {
        probe.reset(new command_probe_t(config.name, config.probe_cmd));
    }
    return model::unit_t::create(std::move(info), std::move(fetcher), std::move(probe));
}

outcome::result<model::registry_ptr_t> make_registry(const config::unit_configs_t &configs) noexcept {
    auto log = utils::get_logger("core.command");
    auto registry = model::registry_ptr_t(new model::registry_t());
    for (auto &config : configs) {
        auto unit = make_unit(config);
        if (!unit) {
            LOG_ERROR(log, "cannot create unit '{}': {}", config.name, unit.assume_error().message());
            return unit.assume_error();
        }
        auto r = registry->register_unit(std::move(unit.assume_value()));
        if (!r) {
            return r.assume_error().ec;
        }
    }
    LOG_DEBUG(log, "{} unit(s) are registered", registry->size());
    return registry;
}

} // namespace syncsched::core
