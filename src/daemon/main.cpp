// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include <boost/program_options.hpp>
#include <rotor/asio.hpp>
#include <rotor/thread.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

#include "syncsched-config.h"
#include "config/utils.h"
#include "core/command_unit.h"
#include "core/core_supervisor.h"
#include "model/trade_calendar.h"
#include "utils/location.h"
#include "utils/log.h"
#include "utils/log-setup.h"
#include "worker/worker_supervisor.h"

#if defined(__linux__)
#include <pthread.h>
#include <signal.h>
#endif

namespace bfs = std::filesystem;
namespace po = boost::program_options;
namespace pt = boost::posix_time;
namespace r = rotor;
namespace ra = r::asio;
namespace rth = r::thread;
namespace asio = boost::asio;

using namespace syncsched;

[[noreturn]] static void report_error_and_die(r::actor_base_t *actor, const r::extended_error_ptr_t &ec) noexcept {
    auto name = actor ? actor->get_identity() : "unknown";
    spdlog::critical("actor '{}' error: {}", name, ec->message());
    std::terminate();
}

struct asio_sys_context_t : ra::system_context_asio_t {
    using parent_t = ra::system_context_asio_t;
    using parent_t::parent_t;
    void on_error(r::actor_base_t *actor, const r::extended_error_ptr_t &ec) noexcept override {
        report_error_and_die(actor, ec);
    }
};

struct thread_sys_context_t : rth::system_context_thread_t {
    using parent_t = rth::system_context_thread_t;
    using parent_t::parent_t;
    void on_error(r::actor_base_t *actor, const r::extended_error_ptr_t &ec) noexcept override {
        report_error_and_die(actor, ec);
    }
};

static std::atomic_bool shutdown_flag = false;

int main(int argc, char **argv) {
#if defined(__linux__)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = [](int) { shutdown_flag = true; };
    if (sigaction(SIGINT, &act, nullptr) != 0 || sigaction(SIGTERM, &act, nullptr) != 0) {
        spdlog::critical("cannot set signal handler");
        return 1;
    }
#endif
    try {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), "sched/main");
#endif
        // clang-format off
        /* parse command-line & config options */
        po::options_description cmdline_descr("Allowed options");
        cmdline_descr.add_options()
            ("help", "show this help message")
            ("log_level", po::value<std::string>()->default_value("info"),
                        "initial log level")
            ("config_dir", po::value<std::string>(),
                        "configuration directory path");
        // clang-format on

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, cmdline_descr), vm);
        po::notify(vm);

        bool show_help = vm.count("help");
        if (show_help) {
            std::cout << cmdline_descr << "\n";
            return 1;
        }

        utils::set_default(vm["log_level"].as<std::string>());

        bfs::path config_file_path;
        if (vm.count("config_dir")) {
            auto path = vm["config_dir"].as<std::string>();
            config_file_path = bfs::path{path};
        } else {
            auto config_default = utils::get_default_config_dir();
            if (config_default) {
                config_file_path = config_default.value();
            } else {
                spdlog::error("cannot determine default config dir: {}", config_default.error().message());
                return 1;
            }
        }

        config_file_path.append("syncsched.toml");
        auto config_file_path_str = config_file_path.string();
        bool populate = !bfs::exists(config_file_path);
        if (populate) {
            spdlog::info("Config {} seems does not exit, creating default one...", config_file_path_str);
            auto cfg_opt = config::generate_config(config_file_path);
            if (!cfg_opt) {
                spdlog::error("cannot generate default config: {}", cfg_opt.error().message());
                return 1;
            }
            auto &cfg = cfg_opt.value();
            auto ec = std::error_code();
            bfs::create_directories(config_file_path.parent_path(), ec);
            if (ec) {
                spdlog::error("cannot create config dir {}: {}", config_file_path.parent_path().string(),
                              ec.message());
                return 1;
            }
            std::fstream f_cfg(config_file_path_str, f_cfg.binary | f_cfg.trunc | f_cfg.in | f_cfg.out);
            auto r = config::serialize(cfg, f_cfg);
            if (!r) {
                spdlog::error("cannot save default config at {}: {}", config_file_path_str, r.error().message());
                return 1;
            }
        }
        std::ifstream config_file(config_file_path_str);
        if (!config_file) {
            spdlog::error("Cannot open config file {}", config_file_path_str);
            return 1;
        }

        config::config_result_t cfg_option = config::get_config(config_file, config_file_path.parent_path());
        if (!cfg_option) {
            spdlog::error("Config file {} is incorrect :: {}", config_file_path_str, cfg_option.error());
            return 1;
        }
        auto &cfg = cfg_option.value();
        spdlog::trace("configuration seems OK");

        bool overwrite_default = !vm["log_level"].defaulted();
        utils::create_root_logger();
        utils::set_default(vm["log_level"].as<std::string>());
        auto init_result = utils::init_loggers(cfg.log_configs, overwrite_default);
        if (!init_result) {
            spdlog::error("Loggers initialization failed :: {}", init_result.error().message());
            return 1;
        }

        auto market = cfg.scheduler_config.market;
        auto source = model::calendar_source_ptr_t(new model::csv_calendar_source_t(cfg.calendar_file, market));
        auto calendar = model::trade_calendar_ptr_t(new model::trade_calendar_t(source, market));
        auto calendar_result = calendar->refresh();
        if (!calendar_result) {
            spdlog::critical("cannot load trade calendar from {} :: {}", cfg.calendar_file.string(),
                             calendar_result.error().message());
            return 1;
        }

        auto registry_result = core::make_registry(cfg.unit_configs);
        if (!registry_result) {
            spdlog::critical("cannot register units :: {}", registry_result.error().message());
            return 1;
        }
        auto &registry = registry_result.value();

        spdlog::info("starting syncsched {}, {} unit(s), {} calendar day(s), concurrency {} over {} worker(s)",
                     SYNCSCHED_VERSION, registry->size(), calendar->total_days(market), cfg.engine_config.concurrency,
                     cfg.engine_config.worker_threads);

        /* pre-init actors */
        asio::io_context io_context;
        ra::system_context_ptr_t sys_context{new asio_sys_context_t{io_context}};
        auto strand = std::make_shared<asio::io_context::strand>(io_context);
        auto timeout = pt::milliseconds{cfg.timeout};
        auto shutdown_timeout = timeout * 2 + pt::milliseconds{cfg.engine_config.shutdown_grace_ms};

        auto sup_core = sys_context->create_supervisor<core::core_supervisor_t>()
                            .app_config(cfg)
                            .registry(registry)
                            .calendar(calendar)
                            .clock(core::make_system_clock())
                            .strand(strand)
                            .timeout(shutdown_timeout)
                            .create_registry()
                            .guard_context(true)
                            .shutdown_flag(shutdown_flag, r::pt::millisec{50})
                            .finish();
        sup_core->start();
        // pre-startup
        sup_core->do_process();

        auto runner_config = worker::runner_config_t{};
        runner_config.max_concurrency = cfg.engine_config.max_partition_concurrency;
        runner_config.est_call_ms = cfg.engine_config.est_call_ms;
        runner_config.retry_attempts = cfg.engine_config.retry_attempts;
        runner_config.retry_backoff_ms = cfg.engine_config.retry_backoff_ms;

        auto worker_count = cfg.engine_config.worker_threads;
        using sys_thread_context_ptr_t = r::intrusive_ptr_t<thread_sys_context_t>;
        std::vector<sys_thread_context_ptr_t> worker_ctxs;
        for (uint32_t i = 1; i <= worker_count; ++i) {
            worker_ctxs.push_back(new thread_sys_context_t{});
            auto &ctx = worker_ctxs.back();
            ctx->create_supervisor<worker::worker_supervisor_t>()
                .timeout(timeout / 2)
                .registry_address(sup_core->get_registry_address())
                .index(i)
                .runner(runner_config)
                .finish();
        }

        /* launch actors */
        auto worker_threads = std::vector<std::thread>();
        for (uint32_t i = 0; i < worker_count; ++i) {
            auto &ctx = worker_ctxs.at(i);
            auto thread = std::thread([ctx = ctx, i = i]() {
#if defined(__linux__)
                std::string name = "sched/worker-" + std::to_string(i + 1);
                pthread_setname_np(pthread_self(), name.c_str());
#endif
                ctx->run();
                shutdown_flag = true;
                spdlog::trace("worker-{} thread has been terminated", i + 1);
            });
            worker_threads.emplace_back(std::move(thread));
        }

        // main loop;
        io_context.run();
        shutdown_flag = true;
        spdlog::trace("main thread loop has been terminated");

        spdlog::trace("waiting worker threads termination");
        for (auto &thread : worker_threads) {
            thread.join();
        }
        spdlog::trace("everything has been terminated");
    } catch (const std::exception &ex) {
        spdlog::critical("starting failure : {}", ex.what());
        return 1;
    }

    /* exit */
    spdlog::info("normal exit");
    spdlog::drop_all();
    return 0;
}
