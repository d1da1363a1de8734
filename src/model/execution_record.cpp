// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "execution_record.h"
#include "misc/error_code.h"
#include "utils/error_code.h"
#include "utils/time.h"
#include <nlohmann/json.hpp>

namespace syncsched::model {

using json = nlohmann::json;

std::string_view to_string(task_kind_t value) noexcept {
    switch (value) {
    case task_kind_t::full:
        return "full";
    case task_kind_t::incremental:
        return "incremental";
    default:
        return "backfill";
    }
}

std::string_view to_string(task_status_t value) noexcept {
    switch (value) {
    case task_status_t::pending:
        return "pending";
    case task_status_t::running:
        return "running";
    case task_status_t::completed:
        return "completed";
    case task_status_t::failed:
        return "failed";
    default:
        return "cancelled";
    }
}

std::string_view to_string(trigger_t value) noexcept {
    switch (value) {
    case trigger_t::manual:
        return "manual";
    case trigger_t::scheduled:
        return "scheduled";
    default:
        return "dependency";
    }
}

std::optional<task_kind_t> task_kind_from_string(std::string_view value) noexcept {
    for (auto v : {task_kind_t::full, task_kind_t::incremental, task_kind_t::backfill}) {
        if (to_string(v) == value) {
            return v;
        }
    }
    return {};
}

std::optional<task_status_t> task_status_from_string(std::string_view value) noexcept {
    for (auto v : {task_status_t::pending, task_status_t::running, task_status_t::completed, task_status_t::failed,
                   task_status_t::cancelled}) {
        if (to_string(v) == value) {
            return v;
        }
    }
    return {};
}

std::optional<trigger_t> trigger_from_string(std::string_view value) noexcept {
    for (auto v : {trigger_t::manual, trigger_t::scheduled, trigger_t::dependency}) {
        if (to_string(v) == value) {
            return v;
        }
    }
    return {};
}

double execution_record_t::progress() const noexcept {
    if (!total) {
        return 0.0;
    }
    return static_cast<double>(processed) / static_cast<double>(total);
}

static json encode_time(const pt::ptime &value) noexcept {
    if (value.is_special()) {
        return nullptr;
    }
    return utils::as_microseconds(value);
}

static bool decode_time(const json &value, pt::ptime &target) noexcept {
    if (value.is_null()) {
        target = pt::ptime();
        return true;
    }
    if (!value.is_number_integer()) {
        return false;
    }
    target = utils::from_microseconds(value.get<std::int64_t>());
    return true;
}

std::string execution_record_t::serialize() const noexcept {
    auto errors_json = json::array();
    for (auto &e : errors) {
        auto item = json::object();
        item["partition"] = e.partition;
        item["message"] = e.message;
        item["transient"] = e.transient;
        item["attempts"] = e.attempts;
        errors_json.push_back(std::move(item));
    }

    auto r = json::object();
    r["id"] = id;
    r["unit"] = unit;
    r["kind"] = std::string(to_string(kind));
    r["trigger"] = std::string(to_string(trigger));
    r["status"] = std::string(to_string(status));
    r["partitions"] = partitions;
    r["total"] = total;
    r["processed"] = processed;
    r["rows_written"] = rows_written;
    r["errors"] = std::move(errors_json);
    r["created_at"] = encode_time(created_at);
    r["started_at"] = encode_time(started_at);
    r["completed_at"] = encode_time(completed_at);
    r["failure_reason"] = failure_reason;
    return r.dump(-1, ' ', false, json::error_handler_t::replace);
}

outcome::result<execution_record_t> execution_record_t::deserialize(std::string_view data) noexcept {
    auto doc = json::parse(data.begin(), data.end(), nullptr, false);
    if (doc.is_discarded()) {
        return utils::make_error_code(utils::error_code_t::malformed_json);
    }
    if (!doc.is_object()) {
        return utils::make_error_code(utils::error_code_t::incorrect_json);
    }

    auto fail = make_error_code(error_code_t::record_deserialization_failure);
    auto get_string = [&](const char *key, std::string &target) -> bool {
        auto it = doc.find(key);
        if (it == doc.end() || !it->is_string()) {
            return false;
        }
        target = it->get<std::string>();
        return true;
    };
    auto get_unsigned = [&](const char *key, auto &target) -> bool {
        auto it = doc.find(key);
        if (it == doc.end() || !it->is_number_unsigned()) {
            return false;
        }
        target = it->get<std::remove_reference_t<decltype(target)>>();
        return true;
    };

    auto r = execution_record_t{};
    std::string kind, trigger, status;
    if (!get_unsigned("id", r.id) || !get_string("unit", r.unit) || !get_string("kind", kind) ||
        !get_string("trigger", trigger) || !get_string("status", status) || !get_unsigned("total", r.total) ||
        !get_unsigned("processed", r.processed) || !get_string("failure_reason", r.failure_reason)) {
        return fail;
    }

    auto kind_opt = task_kind_from_string(kind);
    auto trigger_opt = trigger_from_string(trigger);
    auto status_opt = task_status_from_string(status);
    if (!kind_opt || !trigger_opt || !status_opt) {
        return fail;
    }
    r.kind = *kind_opt;
    r.trigger = *trigger_opt;
    r.status = *status_opt;

    auto rows = doc.find("rows_written");
    if (rows == doc.end() || !rows->is_number_integer()) {
        return fail;
    }
    r.rows_written = rows->get<std::int64_t>();

    auto partitions = doc.find("partitions");
    if (partitions == doc.end() || !partitions->is_array()) {
        return fail;
    }
    for (auto &p : *partitions) {
        if (!p.is_string()) {
            return fail;
        }
        r.partitions.emplace_back(p.get<std::string>());
    }

    auto errors = doc.find("errors");
    if (errors == doc.end() || !errors->is_array()) {
        return fail;
    }
    for (auto &e : *errors) {
        if (!e.is_object()) {
            return fail;
        }
        auto partition = e.find("partition");
        auto message = e.find("message");
        auto transient = e.find("transient");
        auto attempts = e.find("attempts");
        if (partition == e.end() || !partition->is_string() || message == e.end() || !message->is_string() ||
            transient == e.end() || !transient->is_boolean() || attempts == e.end() ||
            !attempts->is_number_unsigned()) {
            return fail;
        }
        r.errors.emplace_back(partition_error_t{partition->get<std::string>(), message->get<std::string>(),
                                                transient->get<bool>(), attempts->get<std::uint32_t>()});
    }

    for (auto [key, target] : {std::pair{"created_at", &r.created_at}, std::pair{"started_at", &r.started_at},
                               std::pair{"completed_at", &r.completed_at}}) {
        auto it = doc.find(key);
        if (it == doc.end() || !decode_time(*it, *target)) {
            return fail;
        }
    }
    return r;
}

} // namespace syncsched::model
