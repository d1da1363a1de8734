// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "unit.h"
#include <boost/outcome.hpp>
#include <boost/system/system_error.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "syncsched-export.h"

namespace syncsched::model {

namespace outcome = boost::outcome_v2;

struct registry_t;
using registry_ptr_t = intrusive_ptr_t<registry_t>;

/** single dependency state as reported by `check_dependencies` */
struct dependency_state_t {
    std::string name;
    std::string reason;
    bool registered;
};

using dependency_states_t = std::vector<dependency_state_t>;

/** registration or ordering failure, `cycle` lists the members of a dependency cycle, e.g. `[A, B, A]` */
struct registry_error_t {
    boost::system::error_code ec;
    std::vector<std::string> cycle;
};

inline const boost::system::error_code &make_error_code(const registry_error_t &error) noexcept { return error.ec; }

inline void outcome_throw_as_system_error_with_payload(const registry_error_t &error) {
    BOOST_OUTCOME_THROW_EXCEPTION(boost::system::system_error(error.ec));
}

template <typename T> using registry_result_t = outcome::result<T, registry_error_t>;

struct dependency_check_t {
    bool satisfied = true;
    dependency_states_t missing;
    /** informational, optional dependencies without data */
    dependency_states_t optional_missing;
};

/** \struct registry_t
 *  \brief units table and dependency resolver
 *
 * The graph is derived from the units dependency lists; it is read-mostly after
 * start up and requires no locking, except the per-unit `enabled` flag which
 * is atomic.
 *
 * Dependencies on units registered later are allowed; such dependencies are
 * reported as missing until the units appear.
 */
struct SYNCSCHED_API registry_t : arc_base_t<registry_t> {
    using names_t = std::vector<std::string>;

    registry_result_t<void> register_unit(unit_ptr_t unit) noexcept;

    unit_ptr_t find(std::string_view name) const noexcept;
    inline std::size_t size() const noexcept { return units.size(); }

    /** units in declaration order */
    names_t names() const noexcept;

    outcome::result<names_t> dependencies_of(std::string_view name) const noexcept;
    outcome::result<dependency_check_t> check_dependencies(std::string_view name) const noexcept;

    /** dependencies first, ties broken by declaration order */
    registry_result_t<names_t> topological_order(const names_t &names) const noexcept;

    /** like `topological_order`, optionally pulling optional dependencies into the plan */
    registry_result_t<names_t> execution_plan(const names_t &names, bool include_optional) const noexcept;

    names_t reverse_dependencies_of(std::string_view name) const noexcept;

    /** the first cycle reachable from the names, e.g. `[A, B, A]`; empty if none */
    names_t find_cycle(const names_t &names) const noexcept;

  private:
    enum class color_t { white, grey, black };
    using colors_t = std::unordered_map<std::string_view, color_t>;

    struct visit_t;

    unit_ptr_t find_unit(std::string_view name) const noexcept;

    std::vector<unit_ptr_t> units;
    std::unordered_map<std::string_view, std::size_t> index;
};

} // namespace syncsched::model
