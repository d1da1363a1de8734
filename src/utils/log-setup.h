// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include "log.h"
#include "config/log.h"
#include <boost/outcome.hpp>
#include <spdlog/sinks/dist_sink.h>
#include "syncsched-export.h"

namespace syncsched::utils {

namespace outcome = boost::outcome_v2;

using dist_sink_t = std::shared_ptr<spdlog::sinks::dist_sink_mt>;
using sink_t = spdlog::sink_ptr;

/** \brief replaces default logger with the one, which writes to the returned dist sink */
SYNCSCHED_API dist_sink_t create_root_logger() noexcept;

/** \brief sets root logger level, used until config is loaded */
SYNCSCHED_API void set_default(std::string_view level) noexcept;

/** \brief (re)creates loggers and their sinks as specified by config
 *
 * The "default" entry configures the root logger, other entries
 * become named loggers, which are parents for the dotted sub-loggers
 * created later via `get_logger`
 */
SYNCSCHED_API outcome::result<void> init_loggers(const config::log_configs_t &configs,
                                                 bool overwrite_default) noexcept;

} // namespace syncsched::utils
