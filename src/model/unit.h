// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "misc/arc.hpp"
#include "partition.h"
#include <boost/outcome.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "syncsched-export.h"

namespace syncsched::model {

namespace outcome = boost::outcome_v2;

enum class cadence_t { daily, weekly, other };

SYNCSCHED_API std::string_view to_string(cadence_t value) noexcept;
SYNCSCHED_API cadence_t cadence_from_string(std::string_view value) noexcept;

/** outcome of a single partition fetch/transform/load call */
struct fetch_result_t {
    std::int64_t rows_written = 0;
    bool transient = false;
    std::optional<std::string> error;

    static fetch_result_t success(std::int64_t rows) noexcept { return {rows, false, {}}; }
    static fetch_result_t failure(std::string message, bool transient) noexcept {
        return {0, transient, std::move(message)};
    }
};

/** \struct fetcher_t
 *  \brief opaque collaborator performing fetch/transform/load of one partition of a unit
 *
 * Invoked from worker threads, possibly concurrently for different
 * partitions of the same unit.
 */
struct SYNCSCHED_API fetcher_t : arc_base_t<fetcher_t> {
    virtual ~fetcher_t() = default;
    virtual fetch_result_t run(std::string_view unit, const partition_t &partition) noexcept = 0;
};

/** \struct probe_t
 *  \brief answers whether unit output already exists for the partition
 *
 * For the all-history partition the question is "does any row exist at all".
 */
struct SYNCSCHED_API probe_t : arc_base_t<probe_t> {
    virtual ~probe_t() = default;
    virtual bool has_data(const partition_t &partition) noexcept = 0;
};

using fetcher_ptr_t = intrusive_ptr_t<fetcher_t>;
using probe_ptr_t = intrusive_ptr_t<probe_t>;

using fetch_fn_t = std::function<fetch_result_t(std::string_view, const partition_t &)>;
using probe_fn_t = std::function<bool(const partition_t &)>;

SYNCSCHED_API fetcher_ptr_t make_fetcher(fetch_fn_t fn) noexcept;
SYNCSCHED_API probe_ptr_t make_probe(probe_fn_t fn) noexcept;

struct unit_t;
using unit_ptr_t = intrusive_ptr_t<unit_t>;

/** static declaration of a unit of work */
struct unit_info_t {
    using names_t = std::vector<std::string>;

    std::string name;
    names_t dependencies;
    names_t optional_dependencies;
    cadence_t cadence = cadence_t::daily;
    /** calls per minute */
    std::uint32_t rate_limit = 120;
    bool enabled = true;
    bool full_scan = false;
};

/** \struct unit_t
 *  \brief ingestible unit of work ("plugin"), immutable except the enabled flag
 */
struct SYNCSCHED_API unit_t : arc_base_t<unit_t> {
    using names_t = unit_info_t::names_t;

    static outcome::result<unit_ptr_t> create(unit_info_t info, fetcher_ptr_t fetcher, probe_ptr_t probe) noexcept;

    inline std::string_view get_name() const noexcept { return info.name; }
    inline const names_t &get_dependencies() const noexcept { return info.dependencies; }
    inline const names_t &get_optional_dependencies() const noexcept { return info.optional_dependencies; }
    inline cadence_t get_cadence() const noexcept { return info.cadence; }
    inline std::uint32_t get_rate_limit() const noexcept { return info.rate_limit; }
    inline bool is_full_scan() const noexcept { return info.full_scan; }
    inline fetcher_t &get_fetcher() const noexcept { return *fetcher; }
    inline probe_t &get_probe() const noexcept { return *probe; }

    inline bool is_enabled() const noexcept { return enabled.load(std::memory_order_acquire); }
    inline void set_enabled(bool value) noexcept { enabled.store(value, std::memory_order_release); }

    /** data-existence probe for "any row exists at all" */
    bool has_data() const noexcept;

  private:
    unit_t(unit_info_t info, fetcher_ptr_t fetcher, probe_ptr_t probe) noexcept;

    unit_info_t info;
    fetcher_ptr_t fetcher;
    probe_ptr_t probe;
    std::atomic_bool enabled;
};

} // namespace syncsched::model
