// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "test-utils.h"
#include "model/registry.h"
#include "model/misc/error_code.h"

using namespace syncsched;
using namespace syncsched::model;
namespace st = syncsched::test;

using names_t = registry_t::names_t;

namespace {

using data_set_ptr_t = st::data_set_ptr_t;

struct fixture_t {
    fixture_t() : registry{new registry_t()} {}

    data_set_ptr_t add(std::string name, names_t deps = {}, names_t optional = {}) {
        auto data = st::data_set_ptr_t(new st::data_set_t());
        auto info = unit_info_t{std::move(name), std::move(deps), std::move(optional)};
        auto r = registry->register_unit(st::make_unit(std::move(info), data));
        REQUIRE(r);
        return data;
    }

    registry_ptr_t registry;
};

} // namespace

TEST_CASE("unit registration", "[registry]") {
    auto registry = registry_ptr_t(new registry_t());
    auto data = st::data_set_ptr_t(new st::data_set_t());
    auto make = [&](std::string name, names_t deps = {}) {
        return st::make_unit(unit_info_t{std::move(name), std::move(deps)}, data);
    };

    REQUIRE(registry->register_unit(make("stock_list")));
    CHECK(registry->size() == 1);
    CHECK(registry->find("stock_list"));
    CHECK(!registry->find("daily_bars"));

    SECTION("duplicate") {
        auto r = registry->register_unit(make("stock_list"));
        REQUIRE(!r);
        CHECK(r.assume_error().ec == make_error_code(error_code_t::unit_already_registered));
        CHECK(registry->size() == 1);
    }

    SECTION("empty name") {
        auto unit = unit_t::create(unit_info_t{}, {}, {});
        REQUIRE(!unit);
        CHECK(unit.assume_error() == make_error_code(error_code_t::empty_unit_name));
    }

    SECTION("forward dependency is allowed") {
        REQUIRE(registry->register_unit(make("adj_bars", {"daily_bars"})));
        auto check = registry->check_dependencies("adj_bars");
        REQUIRE(check);
        CHECK(!check.value().satisfied);
        REQUIRE(check.value().missing.size() == 1);
        CHECK(check.value().missing[0].name == "daily_bars");
        CHECK(check.value().missing[0].reason == "not registered");
        CHECK(!check.value().missing[0].registered);

        REQUIRE(registry->register_unit(make("daily_bars", {"stock_list"})));
        CHECK(registry->names() == names_t{"stock_list", "adj_bars", "daily_bars"});
    }

    SECTION("cycle is rejected and the registry is unchanged") {
        REQUIRE(registry->register_unit(make("a", {"c"})));
        REQUIRE(registry->register_unit(make("b", {"a"})));
        auto r = registry->register_unit(make("c", {"b"}));
        REQUIRE(!r);
        CHECK(r.assume_error().ec == make_error_code(error_code_t::cyclic_dependency));
        CHECK(r.assume_error().cycle == names_t{"c", "b", "a", "c"});
        CHECK(!registry->find("c"));
        CHECK(registry->size() == 3);
    }

    SECTION("self dependency") {
        auto r = registry->register_unit(make("self", {"self"}));
        REQUIRE(!r);
        CHECK(r.assume_error().ec == make_error_code(error_code_t::cyclic_dependency));
        CHECK(r.assume_error().cycle == names_t{"self", "self"});
    }

    SECTION("mutual dependency names both members") {
        REQUIRE(registry->register_unit(make("a", {"b"})));
        auto r = registry->register_unit(make("b", {"a"}));
        REQUIRE(!r);
        CHECK(r.assume_error().ec == make_error_code(error_code_t::cyclic_dependency));
        CHECK(r.assume_error().cycle == names_t{"b", "a", "b"});
        CHECK(registry->find("a"));
        CHECK(!registry->find("b"));
    }
}

TEST_CASE("dependencies", "[registry]") {
    fixture_t f;
    auto list = f.add("stock_list");
    auto bars = f.add("daily_bars", {"stock_list"});
    auto adj = f.add("adj_factor", {"stock_list"});
    auto qfq = f.add("qfq_bars", {"daily_bars", "adj_factor"}, {"stock_list"});
    auto &registry = *f.registry;

    SECTION("dependencies_of") {
        CHECK(registry.dependencies_of("qfq_bars").value() == names_t{"daily_bars", "adj_factor"});
        CHECK(registry.dependencies_of("nope").assume_error() == make_error_code(error_code_t::unknown_unit));
    }

    SECTION("reverse dependencies") {
        CHECK(registry.reverse_dependencies_of("stock_list") == names_t{"daily_bars", "adj_factor"});
        CHECK(registry.reverse_dependencies_of("qfq_bars").empty());
    }

    SECTION("check") {
        auto check = registry.check_dependencies("qfq_bars").value();
        CHECK(!check.satisfied);
        CHECK(check.missing.size() == 2);
        CHECK(check.missing[0].reason == "no data");
        CHECK(check.missing[0].registered);
        CHECK(check.optional_missing.size() == 1);

        bars->put(gr::date(2024, 1, 5));
        check = registry.check_dependencies("qfq_bars").value();
        CHECK(!check.satisfied);
        REQUIRE(check.missing.size() == 1);
        CHECK(check.missing[0].name == "adj_factor");

        adj->put(gr::date(2024, 1, 5));
        check = registry.check_dependencies("qfq_bars").value();
        CHECK(check.satisfied);
        CHECK(check.optional_missing.size() == 1);

        CHECK(registry.check_dependencies("stock_list").value().satisfied);
        CHECK(registry.check_dependencies("nope").assume_error() == make_error_code(error_code_t::unknown_unit));
    }

    SECTION("topological order") {
        auto order = registry.topological_order({"qfq_bars", "stock_list", "adj_factor", "daily_bars"});
        REQUIRE(order);
        CHECK(order.value() == names_t{"stock_list", "daily_bars", "adj_factor", "qfq_bars"});

        order = registry.topological_order({"qfq_bars"});
        REQUIRE(order);
        CHECK(order.value() == names_t{"stock_list", "daily_bars", "adj_factor", "qfq_bars"});

        order = registry.topological_order({"adj_factor"});
        REQUIRE(order);
        CHECK(order.value() == names_t{"stock_list", "adj_factor"});

        CHECK(registry.topological_order({"nope"}).assume_error().ec == make_error_code(error_code_t::unknown_unit));
    }
}

TEST_CASE("execution plan with optional dependencies", "[registry]") {
    fixture_t f;
    f.add("moneyflow", {}, {"index_weights"});
    f.add("stock_list");
    f.add("index_weights", {"stock_list"});
    auto &registry = *f.registry;

    auto plan = registry.execution_plan({"moneyflow", "index_weights"}, false);
    REQUIRE(plan);
    CHECK(plan.value() == names_t{"moneyflow", "stock_list", "index_weights"});

    plan = registry.execution_plan({"moneyflow", "index_weights"}, true);
    REQUIRE(plan);
    CHECK(plan.value() == names_t{"stock_list", "index_weights", "moneyflow"});
}

TEST_CASE("missing required dependency cannot be ordered", "[registry]") {
    fixture_t f;
    f.add("adj_bars", {"daily_bars"});
    auto &registry = *f.registry;
    auto r = registry.topological_order({"adj_bars"});
    REQUIRE(!r);
    CHECK(r.assume_error().ec == make_error_code(error_code_t::unknown_unit));
    CHECK(r.assume_error().cycle.empty());
    CHECK(registry.find_cycle({"adj_bars"}).empty());
}

int _init() {
    st::init_logging();
    return 1;
}

static int v = _init();
