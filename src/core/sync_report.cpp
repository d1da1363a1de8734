// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "sync_report.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <array>
#include <initializer_list>

namespace syncsched::core {

std::string_view to_string(error_type_t value) noexcept {
    switch (value) {
    case error_type_t::none:
        return "none";
    case error_type_t::rate_limit:
        return "rate_limit";
    case error_type_t::timeout:
        return "timeout";
    case error_type_t::connection:
        return "connection";
    case error_type_t::authentication:
        return "authentication";
    case error_type_t::data_not_found:
        return "data_not_found";
    case error_type_t::resource_exhaustion:
        return "resource_exhaustion";
    default:
        return "execution_error";
    }
}

error_type_t classify_error(std::string_view message) noexcept {
    using keywords_t = std::initializer_list<std::string_view>;
    struct rule_t {
        error_type_t type;
        keywords_t keywords;
    };
    // clang-format off
    static const std::array<rule_t, 6> rules = {{
        {error_type_t::rate_limit,          {"rate limit", "429", "freq"}},
        {error_type_t::timeout,             {"timeout", "timed out"}},
        {error_type_t::connection,          {"connection", "refused"}},
        {error_type_t::authentication,      {"auth", "401", "403", "token"}},
        {error_type_t::data_not_found,      {"not found", "404", "no data"}},
        {error_type_t::resource_exhaustion, {"memory", "oom"}},
    }};
    // clang-format on

    if (message.empty()) {
        return error_type_t::none;
    }
    auto lower = boost::algorithm::to_lower_copy(std::string(message));
    for (auto &rule : rules) {
        for (auto keyword : rule.keywords) {
            if (lower.find(keyword) != std::string::npos) {
                return rule.type;
            }
        }
    }
    return error_type_t::execution_error;
}

std::string_view to_string(unit_outcome_t value) noexcept {
    switch (value) {
    case unit_outcome_t::planned:
        return "planned";
    case unit_outcome_t::submitted:
        return "submitted";
    case unit_outcome_t::completed:
        return "completed";
    case unit_outcome_t::failed:
        return "failed";
    case unit_outcome_t::skipped_dependency:
        return "skipped_dependency";
    case unit_outcome_t::skipped_alert:
        return "skipped_alert";
    default:
        return "cancelled";
    }
}

std::string_view to_string(run_status_t value) noexcept {
    switch (value) {
    case run_status_t::running:
        return "running";
    case run_status_t::completed:
        return "completed";
    default:
        return "stopped";
    }
}

unit_report_t *sync_report_t::find(std::string_view unit) noexcept {
    for (auto &u : units) {
        if (u.unit == unit) {
            return &u;
        }
    }
    return nullptr;
}

const unit_report_t *sync_report_t::find(std::string_view unit) const noexcept {
    return const_cast<sync_report_t *>(this)->find(unit);
}

std::size_t sync_report_t::count(unit_outcome_t outcome) const noexcept {
    std::size_t r = 0;
    for (auto &u : units) {
        r += u.outcome == outcome ? 1 : 0;
    }
    return r;
}

auto sync_report_t::failed_units() const noexcept -> names_t {
    names_t r;
    for (auto &u : units) {
        auto o = u.outcome;
        if (o == unit_outcome_t::failed || o == unit_outcome_t::skipped_dependency || o == unit_outcome_t::cancelled) {
            r.emplace_back(u.unit);
        }
    }
    return r;
}

void sync_report_t::apply(const model::execution_record_t &record) noexcept {
    auto unit = find(record.unit);
    if (!unit || unit->task_id != record.id) {
        return;
    }
    unit->rows_written = record.rows_written;
    switch (record.status) {
    case model::task_status_t::completed:
        unit->outcome = unit_outcome_t::completed;
        break;
    case model::task_status_t::cancelled:
        unit->outcome = unit_outcome_t::cancelled;
        break;
    default:
        unit->outcome = unit_outcome_t::failed;
    }
    if (!record.failure_reason.empty()) {
        unit->error = record.failure_reason;
    } else if (!record.errors.empty()) {
        unit->error = record.errors.front().message;
    }
    if (unit->outcome == unit_outcome_t::failed) {
        unit->error_type = classify_error(unit->error);
    }
}

} // namespace syncsched::core
