// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "config/scheduler.h"
#include "db/history_store.h"
#include "model/missing_data.h"
#include "model/task.h"
#include "sync_report.h"
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <rotor.hpp>
#include <optional>
#include <string>

namespace syncsched::core {

namespace r = rotor;
namespace pt = boost::posix_time;

namespace payload {

struct submit_response_t {
    model::task_ptr_t task;
};

struct submit_request_t {
    using response_t = submit_response_t;
    std::string unit;
    model::task_kind_t kind = model::task_kind_t::incremental;
    model::partitions_t partitions;
    model::trigger_t trigger = model::trigger_t::manual;
    bool auto_resolve = false;
};

struct task_status_response_t {
    model::execution_record_t record;
};

struct task_status_request_t {
    using response_t = task_status_response_t;
    model::task_id_t task_id;
};

struct task_cancel_response_t {
    bool cancelled = false;
};

struct task_cancel_request_t {
    using response_t = task_cancel_response_t;
    model::task_id_t task_id;
};

struct task_finished_t {
    model::task_ptr_t task;
    model::execution_record_t record;
};

struct set_concurrency_t {
    std::uint32_t value;
};

struct detect_response_t {
    model::missing_report_t report;
};

struct detect_request_t {
    using response_t = detect_response_t;
    /** the check window ends on the trading day preceding `now` */
    pt::ptime now;
    std::uint32_t lookback_days;
    std::string market;
};

struct refresh_calendar_t {};

struct record_t {
    model::execution_record_t record;
};

struct history_query_response_t {
    db::history_page_t page;
};

struct history_query_request_t {
    using response_t = history_query_response_t;
    db::history_query_t query;
};

struct history_cleanup_response_t {
    std::size_t removed = 0;
};

struct history_cleanup_request_t {
    using response_t = history_cleanup_response_t;
    std::uint32_t retention_days;
    pt::ptime now;
};

struct update_schedule_t {
    config::scheduler_config_t config;
};

struct set_unit_enabled_t {
    std::string unit;
    bool enabled;
};

struct trigger_sync_t {};

struct stop_sync_t {};

struct retry_failed_t {};

struct sync_finished_t {
    sync_report_t report;
};

struct scheduler_status_response_t {
    bool running = false;
    config::scheduler_config_t config{};
    std::optional<pt::ptime> next_missing_check;
    std::optional<pt::ptime> next_sync;
    std::optional<pt::ptime> next_cleanup;
    std::optional<sync_report_t> current;
    std::optional<sync_report_t> last_sync;
    std::optional<model::missing_report_t> last_missing;
};

struct scheduler_status_request_t {
    using response_t = scheduler_status_response_t;
};

} // namespace payload

namespace message {

using submit_request_t = r::request_traits_t<payload::submit_request_t>::request::message_t;
using submit_response_t = r::request_traits_t<payload::submit_request_t>::response::message_t;

using task_status_request_t = r::request_traits_t<payload::task_status_request_t>::request::message_t;
using task_status_response_t = r::request_traits_t<payload::task_status_request_t>::response::message_t;

using task_cancel_request_t = r::request_traits_t<payload::task_cancel_request_t>::request::message_t;
using task_cancel_response_t = r::request_traits_t<payload::task_cancel_request_t>::response::message_t;

using task_finished_t = r::message_t<payload::task_finished_t>;
using set_concurrency_t = r::message_t<payload::set_concurrency_t>;

using detect_request_t = r::request_traits_t<payload::detect_request_t>::request::message_t;
using detect_response_t = r::request_traits_t<payload::detect_request_t>::response::message_t;
using refresh_calendar_t = r::message_t<payload::refresh_calendar_t>;

using record_t = r::message_t<payload::record_t>;

using history_query_request_t = r::request_traits_t<payload::history_query_request_t>::request::message_t;
using history_query_response_t = r::request_traits_t<payload::history_query_request_t>::response::message_t;

using history_cleanup_request_t = r::request_traits_t<payload::history_cleanup_request_t>::request::message_t;
using history_cleanup_response_t = r::request_traits_t<payload::history_cleanup_request_t>::response::message_t;

using update_schedule_t = r::message_t<payload::update_schedule_t>;
using set_unit_enabled_t = r::message_t<payload::set_unit_enabled_t>;
using trigger_sync_t = r::message_t<payload::trigger_sync_t>;
using stop_sync_t = r::message_t<payload::stop_sync_t>;
using retry_failed_t = r::message_t<payload::retry_failed_t>;
using sync_finished_t = r::message_t<payload::sync_finished_t>;

using scheduler_status_request_t = r::request_traits_t<payload::scheduler_status_request_t>::request::message_t;
using scheduler_status_response_t = r::request_traits_t<payload::scheduler_status_request_t>::response::message_t;

} // namespace message

} // namespace syncsched::core
