// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "test-utils.h"
#include "test_supervisor.h"
#include "access.h"
#include "managed_worker.h"
#include "worker/worker_actor.h"
#include "worker/worker_plugin.h"

namespace r = rotor;
namespace st = syncsched::test;
namespace w = syncsched::worker;

using namespace syncsched;
using namespace syncsched::model;

namespace {

task_ptr_t make_task(task_id_t id, const st::data_set_ptr_t &data) {
    auto unit = st::make_unit(unit_info_t{"daily_bars"}, data);
    auto partitions = partitions_t{partition_t(gr::date(2024, 1, 4)), partition_t(gr::date(2024, 1, 5))};
    auto at = st::make_time("20240105", 18);
    return task_ptr_t(new task_t(id, unit, task_kind_t::incremental, trigger_t::manual, std::move(partitions), at));
}

} // namespace

TEST_CASE("worker actor", "[worker]") {
    struct consumer_t : r::actor_base_t {
        using r::actor_base_t::actor_base_t;

        void configure(r::plugin::plugin_base_t &plugin) noexcept override {
            r::actor_base_t::configure(plugin);
            plugin.with_casted<r::plugin::registry_plugin_t>(
                [&](auto &p) { p.discover_name(w::names::worker(1), worker, true).link(); });
            plugin.with_casted<r::plugin::starter_plugin_t>(
                [&](auto &p) { p.subscribe_actor(&consumer_t::on_executed); });
        }

        void execute(task_ptr_t task) { send<w::payload::execute_t>(worker, std::move(task), address); }

        void on_executed(w::message::executed_t &res) noexcept { result = &res; }

        r::address_ptr_t worker;
        r::intrusive_ptr_t<w::message::executed_t> result;
    };

    r::system_context_t ctx;
    auto timeout = r::pt::milliseconds{10};
    auto sup = ctx.create_supervisor<st::supervisor_t>().timeout(timeout).create_registry().finish();
    sup->start();

    auto runner = w::runner_config_t();
    runner.sleeper = [](std::chrono::milliseconds) {};
    sup->create_actor<w::worker_actor_t>().index(1).runner(runner).timeout(timeout).finish();
    auto consumer = sup->create_actor<consumer_t>().timeout(timeout).finish();
    sup->do_process();
    REQUIRE(consumer->worker);

    auto data = st::data_set_ptr_t(new st::data_set_t());
    consumer->execute(make_task(1, data));
    sup->do_process();
    REQUIRE(consumer->result);
    auto &p = consumer->result->payload;
    CHECK(p.worker == 1);
    CHECK(p.status == task_status_t::completed);
    CHECK(p.task->get_id() == 1);
    CHECK(p.task->get_processed() == 2);
    CHECK(data->has("20240104"));
    CHECK(data->has("20240105"));

    sup->shutdown();
    sup->do_process();
}

TEST_CASE("worker plugin", "[worker]") {
    struct dispatcher_t : r::actor_base_t {
        using parent_t = r::actor_base_t;
        using parent_t::parent_t;

        // clang-format off
        using plugins_list_t = std::tuple<
            r::plugin::address_maker_plugin_t,
            r::plugin::lifetime_plugin_t,
            r::plugin::init_shutdown_plugin_t,
            r::plugin::link_server_plugin_t,
            r::plugin::link_client_plugin_t,
            w::worker_plugin_t,
            r::plugin::resources_plugin_t,
            r::plugin::starter_plugin_t
        >;
        // clang-format on

        void configure(r::plugin::plugin_base_t &plugin) noexcept override {
            parent_t::configure(plugin);
            plugin.with_casted<w::worker_plugin_t>([&](auto &p) {
                workers = &p;
                p.configure_workers(2);
            });
            plugin.with_casted<r::plugin::starter_plugin_t>(
                [&](auto &p) { p.subscribe_actor(&dispatcher_t::on_executed); });
        }

        void on_executed(w::message::executed_t &res) noexcept {
            workers->release(res.payload.worker);
            done.emplace_back(res.payload.task->get_id());
        }

        w::worker_plugin_t *workers = nullptr;
        std::vector<task_id_t> done;
    };

    r::system_context_t ctx;
    auto timeout = r::pt::milliseconds{10};
    auto sup = ctx.create_supervisor<st::supervisor_t>().timeout(timeout).create_registry().finish();
    sup->start();
    auto dispatcher = sup->create_actor<dispatcher_t>().timeout(timeout).finish();
    sup->do_process();
    CHECK(static_cast<r::actor_base_t *>(dispatcher.get())->access<st::to::state>() == r::state_t::INITIALIZING);

    auto w1 = sup->create_actor<st::managed_worker_t>().index(1).auto_reply(false).timeout(timeout).finish();
    auto w2 = sup->create_actor<st::managed_worker_t>().index(2).auto_reply(false).timeout(timeout).finish();
    sup->do_process();
    REQUIRE(static_cast<r::actor_base_t *>(dispatcher.get())->access<st::to::state>() == r::state_t::OPERATIONAL);

    auto &workers = *dispatcher->workers;
    CHECK(workers.get_workers_count() == 2);
    CHECK(workers.get_busy_count() == 0);

    auto data = st::data_set_ptr_t(new st::data_set_t());
    auto back = dispatcher->get_address();
    CHECK(workers.dispatch(make_task(1, data), back) == 1u);
    CHECK(workers.dispatch(make_task(2, data), back) == 2u);
    CHECK(!workers.dispatch(make_task(3, data), back));
    CHECK(workers.get_busy_count() == 2);
    sup->do_process();
    CHECK(w1->queue.size() == 1);
    CHECK(w2->queue.size() == 1);

    w2->process();
    sup->do_process();
    CHECK(dispatcher->done == std::vector<task_id_t>{2});
    CHECK(workers.get_busy_count() == 1);

    CHECK(workers.dispatch(make_task(4, data), back) == 2u);
    sup->do_process();
    w2->complete_front(task_status_t::cancelled);
    w1->process();
    sup->do_process();
    CHECK(dispatcher->done == std::vector<task_id_t>{2, 4, 1});
    CHECK(workers.get_busy_count() == 0);
    CHECK(w1->executed == 1);
    CHECK(w2->executed == 2);

    sup->shutdown();
    sup->do_process();
}

int _init() {
    st::init_logging();
    return 1;
}

static int v = _init();
