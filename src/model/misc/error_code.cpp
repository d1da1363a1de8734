// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "error_code.h"
#include <string>

namespace syncsched::model {

namespace detail {

const char *error_code_category_t::name() const noexcept { return "syncsched_model_error"; }

std::string error_code_category_t::message(int c) const {
    std::string r;
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        r = "success";
        break;
    case error_code_t::calendar_unavailable:
        r = "trade calendar is not available for the requested date";
        break;
    case error_code_t::empty_unit_name:
        r = "unit name is empty";
        break;
    case error_code_t::unit_already_registered:
        r = "unit is already registered";
        break;
    case error_code_t::unknown_unit:
        r = "unit is not registered";
        break;
    case error_code_t::cyclic_dependency:
        r = "cyclic dependency";
        break;
    case error_code_t::dependency_not_satisfied:
        r = "dependency is not satisfied";
        break;
    case error_code_t::partition_fetch_transient:
        r = "partition fetch failed (transient)";
        break;
    case error_code_t::partition_fetch_permanent:
        r = "partition fetch failed";
        break;
    case error_code_t::task_not_found:
        r = "no such task";
        break;
    case error_code_t::task_cancelled:
        r = "task has been cancelled";
        break;
    case error_code_t::shutting_down:
        r = "shutting down";
        break;
    case error_code_t::no_partitions:
        r = "task has no partitions";
        break;
    case error_code_t::sync_in_progress:
        r = "synchronization is already in progress";
        break;
    case error_code_t::record_deserialization_failure:
        r = "execution record deserialization failure";
        break;
    case error_code_t::invalid_record_key:
        r = "invalid execution record key";
        break;
    default:
        r = "unknown";
        break;
    }

    r += " (";
    r += std::to_string(c);
    r += ")";

    return r;
}

} // namespace detail

const static detail::error_code_category_t category;

const detail::error_code_category_t &error_code_category() { return category; }

} // namespace syncsched::model
