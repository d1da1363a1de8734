// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "unit.h"
#include "misc/error_code.h"

namespace syncsched::model {

namespace {

struct fn_fetcher_t final : fetcher_t {
    fn_fetcher_t(fetch_fn_t fn_) noexcept : fn{std::move(fn_)} {}

    fetch_result_t run(std::string_view unit, const partition_t &partition) noexcept override {
        try {
            return fn(unit, partition);
        } catch (const std::exception &ex) {
            return fetch_result_t::failure(ex.what(), false);
        }
    }

    fetch_fn_t fn;
};

struct fn_probe_t final : probe_t {
    fn_probe_t(probe_fn_t fn_) noexcept : fn{std::move(fn_)} {}

    bool has_data(const partition_t &partition) noexcept override {
        try {
            return fn(partition);
        } catch (const std::exception &) {
            return false;
        }
    }

    probe_fn_t fn;
};

} // namespace

std::string_view to_string(cadence_t value) noexcept {
    switch (value) {
    case cadence_t::daily:
        return "daily";
    case cadence_t::weekly:
        return "weekly";
    default:
        return "other";
    }
}

cadence_t cadence_from_string(std::string_view value) noexcept {
    if (value == "daily") {
        return cadence_t::daily;
    } else if (value == "weekly") {
        return cadence_t::weekly;
    }
    return cadence_t::other;
}

fetcher_ptr_t make_fetcher(fetch_fn_t fn) noexcept { return fetcher_ptr_t(new fn_fetcher_t(std::move(fn))); }

probe_ptr_t make_probe(probe_fn_t fn) noexcept { return probe_ptr_t(new fn_probe_t(std::move(fn))); }

unit_t::unit_t(unit_info_t info_, fetcher_ptr_t fetcher_, probe_ptr_t probe_) noexcept
    : info{std::move(info_)}, fetcher{std::move(fetcher_)}, probe{std::move(probe_)}, enabled{info.enabled} {}

outcome::result<unit_ptr_t> unit_t::create(unit_info_t info, fetcher_ptr_t fetcher, probe_ptr_t probe) noexcept {
    if (info.name.empty()) {
        return make_error_code(error_code_t::empty_unit_name);
    }
    if (!fetcher) {
        fetcher = make_fetcher([](std::string_view, const partition_t &) { return fetch_result_t::success(0); });
    }
    if (!probe) {
        probe = make_probe([](const partition_t &) { return false; });
    }
    return unit_ptr_t(new unit_t(std::move(info), std::move(fetcher), std::move(probe)));
}

bool unit_t::has_data() const noexcept { return probe->has_data(partition_t::all_history()); }

} // namespace syncsched::model
