// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include <rotor.hpp>
#include <rotor/plugin/registry.h>
#include <vector>
#include <cstdint>
#include <optional>
#include "syncsched-export.h"
#include "messages.h"

namespace syncsched {
namespace worker {

namespace r = rotor;

/** \struct worker_plugin_t
 *  \brief discovers `worker-{i}` actors and tracks which of them are busy
 *
 * A worker executes a single task at a time; the plugin hands a task to the
 * first idle worker.
 */
struct SYNCSCHED_API worker_plugin_t : public r::plugin::registry_plugin_t {
    using parent_t = r::plugin::registry_plugin_t;
    using parent_t::parent_t;

    /** The plugin unique identity to allow further static_cast'ing*/
    static const std::type_index class_identity;

    const std::type_index &identity() const noexcept override;

    void configure_workers(std::uint32_t number) noexcept;

    bool handle_init(r::message::init_request_t *message) noexcept override;

    inline std::size_t get_workers_count() const noexcept { return workers.size(); }
    std::size_t get_busy_count() const noexcept;

    /** returns the worker index, or nothing if all workers are busy */
    std::optional<std::uint32_t> dispatch(model::task_ptr_t task, const r::address_ptr_t &reply_back) noexcept;

    void release(std::uint32_t worker) noexcept;

  private:
    using workers_t = std::vector<r::address_ptr_t>;
    using busy_t = std::vector<bool>;
    workers_t workers;
    busy_t busy;
};

} // namespace worker
} // namespace syncsched
