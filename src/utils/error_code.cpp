// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "error_code.h"

namespace syncsched::utils {

const static detail::error_code_category category;

const detail::error_code_category &error_code_category() { return category; }

namespace detail {

const char *error_code_category::name() const noexcept { return "syncsched_error"; }

std::string error_code_category::message(int c) const {
    std::string r;
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        r = "success";
        break;
    case error_code_t::cant_determine_config_dir:
        r = "config dir cannot be determined";
        break;
    case error_code_t::unknown_sink:
        r = "unknown log sink";
        break;
    case error_code_t::misconfigured_default_logger:
        r = "default logger is misconfigured";
        break;
    case error_code_t::malformed_date:
        r = "malformed date";
        break;
    case error_code_t::malformed_time:
        r = "malformed time of day";
        break;
    case error_code_t::malformed_json:
        r = "malformed json";
        break;
    case error_code_t::incorrect_json:
        r = "incorrect json";
        break;
    case error_code_t::calendar_source_failure:
        r = "trade calendar source cannot be read";
        break;
    case error_code_t::command_failure:
        r = "external command cannot be executed";
        break;
    default:
        r = "unknown";
    }
    r += " (";
    r += std::to_string(c) + ")";
    return r;
}

} // namespace detail
} // namespace syncsched::utils
