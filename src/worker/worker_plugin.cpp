// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "worker_plugin.h"
#include "names.h"
#include <algorithm>

using namespace rotor;
using namespace syncsched::worker;

const std::type_index worker_plugin_t::class_identity = typeid(worker_plugin_t);

const std::type_index &worker_plugin_t::identity() const noexcept { return class_identity; }

bool worker_plugin_t::handle_init(r::message::init_request_t *message) noexcept {
    return parent_t::handle_init(message) && [this]() -> bool {
        for (auto &addr : workers) {
            if (!addr) {
                return false;
            }
        }
        return true;
    }();
}

void worker_plugin_t::configure_workers(std::uint32_t number) noexcept {
    workers.resize(number);
    busy.resize(number, false);

    for (std::uint32_t i = 0; i < number; ++i) {
        discover_name(names::worker(i + 1), workers[i], true).link(false);
    }
}

std::size_t worker_plugin_t::get_busy_count() const noexcept {
    return static_cast<std::size_t>(std::count(busy.begin(), busy.end(), true));
}

std::optional<std::uint32_t> worker_plugin_t::dispatch(model::task_ptr_t task,
                                                       const r::address_ptr_t &reply_back) noexcept {
    auto it = std::find(busy.begin(), busy.end(), false);
    if (it == busy.end()) {
        return {};
    }
    auto index = static_cast<std::uint32_t>(std::distance(busy.begin(), it));
    *it = true;
    actor->send<payload::execute_t>(workers[index], std::move(task), reply_back);
    return index + 1;
}

void worker_plugin_t::release(std::uint32_t worker) noexcept {
    if (worker >= 1 && worker <= busy.size()) {
        busy[worker - 1] = false;
    }
}
