// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "core/messages.h"
#include "utils/log.h"
#include "syncsched-test-export.h"
#include <rotor.hpp>

namespace syncsched::test {

namespace r = rotor;

/** \struct history_sink_t
 *  \brief registers itself as history actor and keeps everything in memory
 *
 * It also plays the detector role: the calendar refreshes are counted and
 * detection requests are queued for manual replies.
 */
struct SYNCSCHED_TEST_API history_sink_t : r::actor_base_t {
    using parent_t = r::actor_base_t;
    using parent_t::parent_t;
    using records_t = model::execution_records_t;
    using detect_request_ptr_t = r::intrusive_ptr_t<core::message::detect_request_t>;
    using cleanup_request_ptr_t = r::intrusive_ptr_t<core::message::history_cleanup_request_t>;

    void configure(r::plugin::plugin_base_t &plugin) noexcept override;

    void on_record(core::message::record_t &message) noexcept;
    void on_cleanup(core::message::history_cleanup_request_t &req) noexcept;
    void on_detect(core::message::detect_request_t &req) noexcept;
    void on_refresh(core::message::refresh_calendar_t &) noexcept;
    void on_sync_finished(core::message::sync_finished_t &message) noexcept;

    /** collects the finished sync runs of the scheduler */
    void watch(const r::address_ptr_t &scheduler) noexcept;

    void reply_detection(model::missing_report_t report) noexcept;
    void reply_cleanup(std::size_t removed) noexcept;

    utils::logger_t log;
    records_t records;
    std::vector<core::sync_report_t> sync_reports;
    std::vector<detect_request_ptr_t> detections;
    std::vector<cleanup_request_ptr_t> cleanups;
    std::size_t refreshes = 0;
};

} // namespace syncsched::test
