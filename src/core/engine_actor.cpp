// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "engine_actor.h"
#include "names.h"
#include "model/misc/error_code.h"
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <iterator>

using namespace syncsched::core;

namespace {
namespace resource {
r::plugin::resource_id_t task = 0;
r::plugin::resource_id_t timer = 1;
} // namespace resource

std::string describe(const syncsched::model::dependency_states_t &states) noexcept {
    auto items = std::vector<std::string>();
    for (auto &s : states) {
        items.emplace_back(fmt::format("{} ({})", s.name, s.reason));
    }
    return boost::algorithm::join(items, ", ");
}

} // namespace

engine_actor_t::engine_actor_t(config_t &cfg)
    : r::actor_base_t(cfg), registry{cfg.registry}, engine_config{cfg.engine_config}, clock{cfg.clock},
      concurrency{std::max(cfg.engine_config.concurrency, std::uint32_t{1})} {}

void engine_actor_t::configure(r::plugin::plugin_base_t &plugin) noexcept {
    r::actor_base_t::configure(plugin);
    plugin.with_casted<r::plugin::address_maker_plugin_t>([&](auto &p) {
        p.set_identity(names::engine, false);
        log = utils::get_logger(identity);
    });
    plugin.with_casted<worker::worker_plugin_t>([&](auto &p) {
        workers = &p;
        p.register_name(names::engine, get_address());
        p.discover_name(names::history, history, true).link(false);
        p.configure_workers(engine_config.worker_threads);
    });
    plugin.with_casted<r::plugin::starter_plugin_t>([&](auto &p) {
        p.subscribe_actor(&engine_actor_t::on_submit);
        p.subscribe_actor(&engine_actor_t::on_task_status);
        p.subscribe_actor(&engine_actor_t::on_task_cancel);
        p.subscribe_actor(&engine_actor_t::on_set_concurrency);
        p.subscribe_actor(&engine_actor_t::on_executed);
    });
}

void engine_actor_t::on_start() noexcept {
    LOG_TRACE(log, "on_start");
    if (concurrency > workers->get_workers_count()) {
        LOG_WARN(log, "concurrency {} exceeds the number of workers ({})", concurrency, workers->get_workers_count());
    }
    r::actor_base_t::on_start();
}

void engine_actor_t::shutdown_start() noexcept {
    LOG_TRACE(log, "shutdown_start");
    r::actor_base_t::shutdown_start();

    auto pending = std::vector<model::task_ptr_t>();
    for (auto &task : queue) {
        pending.emplace_back(task);
    }
    for (auto &it : parked) {
        pending.emplace_back(it.second.task);
    }
    queue.clear();
    parked.clear();
    waiters.clear();
    for (auto &task : pending) {
        finish(task, model::task_status_t::failed, "shutdown");
    }

    if (!running.empty()) {
        LOG_INFO(log, "cancelling {} running task(s), grace period {}ms", running.size(),
                 engine_config.shutdown_grace_ms);
        for (auto &it : running) {
            active.at(it.first)->request_cancel();
        }
        auto timeout = r::pt::milliseconds{engine_config.shutdown_grace_ms};
        grace_timer = start_timer(timeout, *this, &engine_actor_t::on_grace_timer);
        resources->acquire(resource::timer);
    }
}

void engine_actor_t::shutdown_finish() noexcept {
    LOG_TRACE(log, "shutdown_finish");
    r::actor_base_t::shutdown_finish();
}

void engine_actor_t::on_grace_timer(r::request_id_t, bool cancelled) noexcept {
    resources->release(resource::timer);
    grace_timer.reset();
    if (cancelled) {
        return;
    }
    auto tasks = std::vector<model::task_ptr_t>();
    for (auto &it : running) {
        tasks.emplace_back(active.at(it.first));
        resources->release(resource::task);
    }
    running.clear();
    LOG_WARN(log, "grace period expired, {} task(s) are still running", tasks.size());
    for (auto &task : tasks) {
        finish(task, model::task_status_t::failed, "shutdown");
    }
}

void engine_actor_t::on_submit(message::submit_request_t &req) noexcept {
    auto &p = req.payload.request_payload;
    auto details = std::string();
    auto r = submit(p.unit, p.kind, p.partitions, p.trigger, p.auto_resolve, details);
    if (!r) {
        auto ec = r.assume_error();
        auto context = details.empty() ? std::string(identity) : fmt::format("{} ({})", identity, details);
        LOG_WARN(log, "cannot submit task for '{}': {}{}", p.unit, ec.message(),
                 details.empty() ? std::string() : fmt::format(", {}", details));
        return reply_with_error(req, r::make_error(context, ec));
    }
    reply_to(req, std::move(r.assume_value()));
    dispatch();
}

auto engine_actor_t::submit(const std::string &unit_name, model::task_kind_t kind, model::partitions_t partitions,
                            model::trigger_t trigger, bool auto_resolve, std::string &details) noexcept
    -> outcome::result<model::task_ptr_t> {
    if (state >= r::state_t::SHUTTING_DOWN) {
        return model::make_error_code(model::error_code_t::shutting_down);
    }
    auto unit = registry->find(unit_name);
    if (!unit) {
        details = unit_name;
        return model::make_error_code(model::error_code_t::unknown_unit);
    }
    if (kind == model::task_kind_t::full) {
        partitions = {model::partition_t::all_history()};
    } else if (partitions.empty()) {
        return model::make_error_code(model::error_code_t::no_partitions);
    }

    auto check_result = registry->check_dependencies(unit_name);
    if (!check_result) {
        return check_result.assume_error();
    }
    auto &check = check_result.assume_value();
    if (check.satisfied) {
        auto task = make_task(unit, kind, std::move(partitions), trigger);
        enqueue(task);
        return task;
    }

    auto ec = model::make_error_code(model::error_code_t::dependency_not_satisfied);
    if (!auto_resolve) {
        details = describe(check.missing);
        return ec;
    }
    auto unresolvable = model::dependency_states_t();
    std::copy_if(check.missing.begin(), check.missing.end(), std::back_inserter(unresolvable),
                 [](auto &s) { return !s.registered; });
    if (!unresolvable.empty()) {
        details = describe(unresolvable);
        return ec;
    }

    auto waits = task_ids_t();
    for (auto &dep : check.missing) {
        auto dep_task = find_active(dep.name);
        if (!dep_task) {
            auto r = submit(dep.name, model::task_kind_t::full, {}, model::trigger_t::dependency, true, details);
            if (!r) {
                return r;
            }
            dep_task = std::move(r.assume_value());
            LOG_DEBUG(log, "task {} ({}) is spawned to resolve dependency of '{}'", dep_task->get_id(), dep.name,
                      unit_name);
        }
        waits.emplace(dep_task->get_id());
    }
    auto task = make_task(unit, kind, std::move(partitions), trigger);
    park(task, std::move(waits));
    return task;
}

model::task_ptr_t engine_actor_t::make_task(const model::unit_ptr_t &unit, model::task_kind_t kind,
                                            model::partitions_t partitions, model::trigger_t trigger) noexcept {
    auto id = next_id++;
    auto task = model::task_ptr_t(new model::task_t(id, unit, kind, trigger, std::move(partitions), clock->now()));
    active.emplace(id, task);
    LOG_DEBUG(log, "task {} ({}, {}, {} partition(s)) is created", id, unit->get_name(), model::to_string(kind),
              task->get_partitions().size());
    return task;
}

model::task_ptr_t engine_actor_t::find_active(std::string_view unit) noexcept {
    for (auto &it : active) {
        if (it.second->get_unit().get_name() == unit) {
            return it.second;
        }
    }
    return {};
}

model::task_ptr_t engine_actor_t::find_task(model::task_id_t id) noexcept {
    auto it = active.find(id);
    if (it != active.end()) {
        return it->second;
    }
    auto f = finished.find(id);
    if (f != finished.end()) {
        return f->second;
    }
    return {};
}

void engine_actor_t::park(model::task_ptr_t task, task_ids_t waits) noexcept {
    auto id = task->get_id();
    for (auto dep_id : waits) {
        waiters[dep_id].emplace_back(id);
    }
    LOG_DEBUG(log, "task {} waits for {} dependency task(s)", id, waits.size());
    parked.emplace(id, parked_t{std::move(task), std::move(waits)});
}

void engine_actor_t::unpark(model::task_id_t id) noexcept {
    auto it = parked.find(id);
    if (it == parked.end()) {
        return;
    }
    for (auto dep_id : it->second.waits) {
        auto w = waiters.find(dep_id);
        if (w != waiters.end()) {
            auto &ids = w->second;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
            if (ids.empty()) {
                waiters.erase(w);
            }
        }
    }
    parked.erase(it);
}

void engine_actor_t::wake(model::task_id_t finished_id) noexcept {
    auto w = waiters.find(finished_id);
    if (w == waiters.end()) {
        return;
    }
    auto ids = std::move(w->second);
    waiters.erase(w);

    for (auto id : ids) {
        auto it = parked.find(id);
        if (it == parked.end()) {
            continue;
        }
        auto &waits = it->second.waits;
        waits.erase(finished_id);
        if (!waits.empty()) {
            continue;
        }
        auto task = std::move(it->second.task);
        parked.erase(it);

        auto &unit = task->get_unit();
        auto check = registry->check_dependencies(unit.get_name());
        if (check && check.assume_value().satisfied) {
            enqueue(std::move(task));
        } else {
            auto reason = std::string(model::make_error_code(model::error_code_t::dependency_not_satisfied).message());
            if (check) {
                reason = fmt::format("{}: {}", reason, describe(check.assume_value().missing));
            }
            finish(std::move(task), model::task_status_t::failed, std::move(reason));
        }
    }
}

void engine_actor_t::enqueue(model::task_ptr_t task) noexcept {
    LOG_TRACE(log, "task {} is queued", task->get_id());
    queue.emplace_back(std::move(task));
}

void engine_actor_t::dispatch() noexcept {
    if (state >= r::state_t::SHUTTING_DOWN) {
        return;
    }
    while (!queue.empty() && running.size() < concurrency &&
           workers->get_busy_count() < workers->get_workers_count()) {
        auto task = queue.front();
        queue.pop_front();
        task->mark_running(clock->now());
        auto worker = workers->dispatch(task, get_address());
        running.emplace(task->get_id(), *worker);
        resources->acquire(resource::task);
        LOG_DEBUG(log, "task {} ({}) is started on worker-{}, running: {}", task->get_id(),
                  task->get_unit().get_name(), *worker, running.size());
    }
}

void engine_actor_t::on_executed(worker::message::executed_t &message) noexcept {
    auto &p = message.payload;
    auto &task = p.task;
    workers->release(p.worker);

    auto it = running.find(task->get_id());
    if (it == running.end()) {
        LOG_DEBUG(log, "ignoring late result of task {}", task->get_id());
        return;
    }
    running.erase(it);
    resources->release(resource::task);

    finish(task, p.status);

    if (grace_timer && running.empty()) {
        cancel_timer(*grace_timer);
    }
    dispatch();
}

void engine_actor_t::finish(model::task_ptr_t task, model::task_status_t status, std::string reason) noexcept {
    if (reason.empty()) {
        if (status == model::task_status_t::failed) {
            reason = "all partitions failed";
        } else if (status == model::task_status_t::cancelled) {
            reason = "cancelled";
        }
    }
    if (!task->finish(status, clock->now(), std::move(reason))) {
        return;
    }
    on_terminal(task);
}

void engine_actor_t::on_terminal(const model::task_ptr_t &task) noexcept {
    auto record = task->make_record();
    auto id = task->get_id();
    if (record.status == model::task_status_t::completed) {
        LOG_INFO(log, "task {} ({}) completed, {}/{} partition(s) processed, {} row(s) written, errors: {}", id,
                 record.unit, record.processed, record.total, record.rows_written, record.errors.size());
    } else {
        LOG_WARN(log, "task {} ({}) {}: {}", id, record.unit, model::to_string(record.status), record.failure_reason);
    }

    active.erase(id);
    remember(task);
    send<payload::record_t>(history, record);
    send<payload::task_finished_t>(get_address(), task, std::move(record));
    wake(id);
}

void engine_actor_t::remember(const model::task_ptr_t &task) noexcept {
    if (!engine_config.keep_finished) {
        return;
    }
    finished.emplace(task->get_id(), task);
    finished_order.emplace_back(task->get_id());
    while (finished_order.size() > engine_config.keep_finished) {
        finished.erase(finished_order.front());
        finished_order.pop_front();
    }
}

void engine_actor_t::on_task_status(message::task_status_request_t &req) noexcept {
    auto id = req.payload.request_payload.task_id;
    auto task = find_task(id);
    if (!task) {
        auto ec = model::make_error_code(model::error_code_t::task_not_found);
        return reply_with_error(req, make_error(ec));
    }
    reply_to(req, task->make_record());
}

void engine_actor_t::on_task_cancel(message::task_cancel_request_t &req) noexcept {
    auto id = req.payload.request_payload.task_id;
    auto it = active.find(id);
    if (it == active.end()) {
        if (finished.count(id)) {
            return reply_to(req, false);
        }
        auto ec = model::make_error_code(model::error_code_t::task_not_found);
        return reply_with_error(req, make_error(ec));
    }
    auto task = it->second;
    if (running.count(id)) {
        LOG_DEBUG(log, "cancel of running task {} is requested", id);
        task->request_cancel();
        return reply_to(req, true);
    }

    auto q = std::find(queue.begin(), queue.end(), task);
    if (q != queue.end()) {
        queue.erase(q);
    } else {
        unpark(id);
    }
    reply_to(req, true);
    finish(std::move(task), model::task_status_t::cancelled);
}

void engine_actor_t::on_set_concurrency(message::set_concurrency_t &message) noexcept {
    auto value = std::max(message.payload.value, std::uint32_t{1});
    LOG_INFO(log, "concurrency {} -> {}", concurrency, value);
    if (value > workers->get_workers_count()) {
        LOG_WARN(log, "concurrency {} exceeds the number of workers ({})", value, workers->get_workers_count());
    }
    concurrency = value;
    dispatch();
}
