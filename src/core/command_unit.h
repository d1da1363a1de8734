// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/unit.h"
#include "model/registry.h"
#include "model/unit.h"
#include "utils/log.h"
#include <boost/outcome.hpp>
#include <string>
#include <string_view>
#include "syncsched-export.h"

namespace syncsched::core {

namespace outcome = boost::outcome_v2;

/** the command exit code which marks a failure as transient (`EX_TEMPFAIL`) */
inline constexpr int transient_exit_code = 75;

struct command_output_t {
    int exit_code;
    std::string output;
};

/** runs the command via the shell, capturing its stdout */
SYNCSCHED_API outcome::result<command_output_t> run_command(const std::string &command) noexcept;

/** substitutes `{unit}` and `{partition}` placeholders */
SYNCSCHED_API std::string expand_command(std::string_view pattern, std::string_view unit,
                                         const model::partition_t &partition) noexcept;

/** \struct command_fetcher_t
 *  \brief fetches a partition by running an external command
 *
 * Exit code 0 is a success, an optional row count may be printed on stdout;
 * exit code 75 is a transient failure, anything else is a permanent failure.
 */
struct SYNCSCHED_API command_fetcher_t final : model::fetcher_t {
    explicit command_fetcher_t(std::string pattern) noexcept;
    model::fetch_result_t run(std::string_view unit, const model::partition_t &partition) noexcept override;

  private:
    std::string pattern;
    utils::logger_t log;
};

/** \struct command_probe_t
 *  \brief data is present when the command exits with 0
 */
struct SYNCSCHED_API command_probe_t final : model::probe_t {
    command_probe_t(std::string unit, std::string pattern) noexcept;
    bool has_data(const model::partition_t &partition) noexcept override;

  private:
    std::string unit;
    std::string pattern;
    utils::logger_t log;
};

SYNCSCHED_API outcome::result<model::unit_ptr_t> make_unit(const config::unit_config_t &config) noexcept;

/** registers units in declaration order, a dependency cycle is fatal */
SYNCSCHED_API outcome::result<model::registry_ptr_t> make_registry(const config::unit_configs_t &configs) noexcept;

} // namespace syncsched::core
