// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "test-utils.h"
#include "core/command_unit.h"
#include "model/misc/error_code.h"

using namespace syncsched;
using namespace syncsched::core;
namespace st = syncsched::test;
namespace bfs = std::filesystem;
namespace gr = boost::gregorian;

namespace {
config::unit_config_t make_config(std::string name, std::string fetch, std::string probe) {
    return config::unit_config_t{std::move(name), {}, {}, "daily", true, false, 120, std::move(fetch),
                                 std::move(probe)};
}
} // namespace

TEST_CASE("command expansion", "[command]") {
    auto day = model::partition_t(gr::date(2024, 1, 5));
    CHECK(expand_command("fetch {unit} --date {partition}", "daily_bars", day) ==
          "fetch daily_bars --date 20240105");
    CHECK(expand_command("fetch {unit} {partition} {partition}", "x", model::partition_t::all_history()) ==
          "fetch x all all");
    CHECK(expand_command("true", "x", day) == "true");
}

TEST_CASE("run command", "[command]") {
    auto r = run_command("echo 12; exit 3");
    REQUIRE(r);
    CHECK(r.value().exit_code == 3);
    CHECK(r.value().output == "12\n");
}

TEST_CASE("command fetcher", "[command]") {
    auto day = model::partition_t(gr::date(2024, 1, 5));

    SECTION("success with rows") {
        auto fetcher = command_fetcher_t("echo 42");
        auto r = fetcher.run("daily_bars", day);
        CHECK(!r.error);
        CHECK(r.rows_written == 42);
    }
    SECTION("success without rows") {
        auto fetcher = command_fetcher_t("true");
        auto r = fetcher.run("daily_bars", day);
        CHECK(!r.error);
        CHECK(r.rows_written == 0);
    }
    SECTION("transient failure") {
        auto fetcher = command_fetcher_t("echo 'rate limit'; exit 75");
        auto r = fetcher.run("daily_bars", day);
        REQUIRE(r.error);
        CHECK(r.transient);
        CHECK(*r.error == "rate limit (exit code 75)");
    }
    SECTION("permanent failure") {
        auto fetcher = command_fetcher_t("exit 2");
        auto r = fetcher.run("daily_bars", day);
        REQUIRE(r.error);
        CHECK(!r.transient);
        CHECK(r.error->find("exited with code 2") != std::string::npos);
    }
}

TEST_CASE("units from config", "[command]") {
    auto dir = st::unique_path();
    bfs::create_directory(dir);
    auto dir_guard = st::path_guard_t(dir);
    auto marker = (dir / "{unit}-{partition}").string();

    auto fetch = fmt::format("touch {}", marker);
    auto probe = fmt::format("ls {}/{{unit}}-* >/dev/null 2>&1", dir.string());
    auto configs = config::unit_configs_t{
        make_config("stock_list", fetch, probe),
        make_config("daily_bars", "", ""),
    };
    configs[1].dependencies = {"stock_list"};
    configs[1].cadence = "weekly";

    auto registry_opt = make_registry(configs);
    REQUIRE(registry_opt);
    auto &registry = registry_opt.value();
    REQUIRE(registry->size() == 2);

    auto list = registry->find("stock_list");
    CHECK(!list->has_data());
    auto r = list->get_fetcher().run("stock_list", model::partition_t::all_history());
    CHECK(!r.error);
    CHECK(bfs::exists(dir / "stock_list-all"));
    CHECK(list->has_data());

    auto bars = registry->find("daily_bars");
    CHECK(bars->get_cadence() == model::cadence_t::weekly);
    CHECK(!bars->has_data());
    CHECK(registry->check_dependencies("daily_bars").value().satisfied);

    SECTION("cycle") {
        configs[0].dependencies = {"daily_bars"};
        auto r = make_registry(configs);
        REQUIRE(!r);
        CHECK(r.assume_error() == model::make_error_code(model::error_code_t::cyclic_dependency));
    }
}

int _init() {
    st::init_logging();
    return 1;
}

static int v = _init();
