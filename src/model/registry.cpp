// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "registry.h"
#include "misc/error_code.h"
#include "utils/log.h"
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <unordered_set>

namespace syncsched::model {

struct registry_t::visit_t {
    visit_t(const registry_t &registry_, bool include_optional_, bool skip_unknown_ = false) noexcept
        : registry{registry_}, include_optional{include_optional_}, skip_unknown{skip_unknown_} {}

    outcome::result<void> operator()(const unit_t &unit) noexcept {
        auto name = unit.get_name();
        auto &color = colors[name];
        if (color == color_t::black) {
            return outcome::success();
        }
        if (color == color_t::grey) {
            auto it = std::find(path.begin(), path.end(), name);
            cycle.assign(it, path.end());
            cycle.emplace_back(name);
            return make_error_code(error_code_t::cyclic_dependency);
        }
        color = color_t::grey;
        path.emplace_back(name);

        auto visit_deps = [&](const names_t &deps, bool required) -> outcome::result<void> {
            for (auto &dep : deps) {
                auto dep_unit = registry.find_unit(dep);
                if (!dep_unit) {
                    if (!required || skip_unknown) {
                        continue;
                    }
                    unknown = dep;
                    return make_error_code(error_code_t::unknown_unit);
                }
                auto r = (*this)(*dep_unit);
                if (!r) {
                    return r;
                }
            }
            return outcome::success();
        };

        auto r = visit_deps(unit.get_dependencies(), true);
        if (r && include_optional) {
            r = visit_deps(unit.get_optional_dependencies(), false);
        }
        if (!r) {
            return r;
        }

        path.pop_back();
        colors[name] = color_t::black;
        order.emplace_back(name);
        return outcome::success();
    }

    const registry_t &registry;
    bool include_optional;
    bool skip_unknown;
    colors_t colors;
    std::vector<std::string_view> path;
    names_t order;
    names_t cycle;
    std::string unknown;
};

static std::string format_path(const registry_t::names_t &names) noexcept {
    return boost::algorithm::join(names, " -> ");
}

unit_ptr_t registry_t::find_unit(std::string_view name) const noexcept {
    auto it = index.find(name);
    if (it == index.end()) {
        return {};
    }
    return units[it->second];
}

unit_ptr_t registry_t::find(std::string_view name) const noexcept { return find_unit(name); }

registry_result_t<void> registry_t::register_unit(unit_ptr_t unit) noexcept {
    auto log = utils::get_logger("model.registry");
    auto name = unit->get_name();
    if (name.empty()) {
        return registry_error_t{make_error_code(error_code_t::empty_unit_name), {}};
    }
    if (index.count(name)) {
        LOG_ERROR(log, "unit '{}' is already registered", name);
        return registry_error_t{make_error_code(error_code_t::unit_already_registered), {}};
    }
    index.emplace(name, units.size());
    units.emplace_back(unit);

    // the graph was acyclic before, so any new cycle passes through the new unit
    auto cycle = find_cycle({std::string(name)});
    if (!cycle.empty()) {
        LOG_CRITICAL(log, "cyclic dependency detected: {}", format_path(cycle));
        index.erase(name);
        units.pop_back();
        return registry_error_t{make_error_code(error_code_t::cyclic_dependency), std::move(cycle)};
    }
    LOG_DEBUG(log, "registered unit '{}' ({} dependencies, cadence: {})", name, unit->get_dependencies().size(),
              to_string(unit->get_cadence()));
    return outcome::success();
}

auto registry_t::names() const noexcept -> names_t {
    names_t r;
    r.reserve(units.size());
    for (auto &u : units) {
        r.emplace_back(u->get_name());
    }
    return r;
}

auto registry_t::dependencies_of(std::string_view name) const noexcept -> outcome::result<names_t> {
    auto unit = find_unit(name);
    if (!unit) {
        return make_error_code(error_code_t::unknown_unit);
    }
    return unit->get_dependencies();
}

outcome::result<dependency_check_t> registry_t::check_dependencies(std::string_view name) const noexcept {
    auto unit = find_unit(name);
    if (!unit) {
        return make_error_code(error_code_t::unknown_unit);
    }
    auto r = dependency_check_t{};
    for (auto &dep : unit->get_dependencies()) {
        auto dep_unit = find_unit(dep);
        if (!dep_unit) {
            r.missing.emplace_back(dependency_state_t{dep, "not registered", false});
        } else if (!dep_unit->has_data()) {
            r.missing.emplace_back(dependency_state_t{dep, "no data", true});
        }
    }
    for (auto &dep : unit->get_optional_dependencies()) {
        auto dep_unit = find_unit(dep);
        if (!dep_unit) {
            r.optional_missing.emplace_back(dependency_state_t{dep, "not registered", false});
        } else if (!dep_unit->has_data()) {
            r.optional_missing.emplace_back(dependency_state_t{dep, "no data", true});
        }
    }
    r.satisfied = r.missing.empty();
    return r;
}

auto registry_t::topological_order(const names_t &names) const noexcept -> registry_result_t<names_t> {
    return execution_plan(names, false);
}

auto registry_t::execution_plan(const names_t &names, bool include_optional) const noexcept
    -> registry_result_t<names_t> {
    auto log = utils::get_logger("model.registry");
    auto requested = std::unordered_set<std::string_view>();
    for (auto &name : names) {
        if (!find_unit(name)) {
            LOG_ERROR(log, "cannot order unknown unit '{}'", name);
            return registry_error_t{make_error_code(error_code_t::unknown_unit), {}};
        }
        requested.emplace(name);
    }

    auto visit = visit_t(*this, include_optional);
    for (auto &unit : units) {
        if (!requested.count(unit->get_name())) {
            continue;
        }
        auto r = visit(*unit);
        if (!r) {
            if (r.assume_error() == make_error_code(error_code_t::cyclic_dependency)) {
                LOG_CRITICAL(log, "cyclic dependency detected: {}", format_path(visit.cycle));
            } else {
                LOG_ERROR(log, "unit '{}' depends on unknown unit '{}'", unit->get_name(), visit.unknown);
            }
            return registry_error_t{r.assume_error(), std::move(visit.cycle)};
        }
    }
    return std::move(visit.order);
}

auto registry_t::reverse_dependencies_of(std::string_view name) const noexcept -> names_t {
    names_t r;
    for (auto &unit : units) {
        auto &deps = unit->get_dependencies();
        if (std::find(deps.begin(), deps.end(), name) != deps.end()) {
            r.emplace_back(unit->get_name());
        }
    }
    return r;
}

auto registry_t::find_cycle(const names_t &names) const noexcept -> names_t {
    auto visit = visit_t(*this, false, true);
    for (auto &name : names) {
        auto unit = find_unit(name);
        if (!unit) {
            continue;
        }
        if (!visit(*unit)) {
            return std::move(visit.cycle);
        }
    }
    return {};
}

} // namespace syncsched::model
