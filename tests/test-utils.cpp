// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "test-utils.h"
#include "utils/log-setup.h"
#include "utils/time.h"
#include <cassert>
#include <iostream>
#include <random>
#include <cstdint>
#include <spdlog/sinks/stdout_color_sinks.h>

int main(int argc, char *argv[]) { return Catch::Session().run(argc, argv); }

namespace syncsched::test {

path_guard_t::path_guard_t() = default;

path_guard_t::path_guard_t(const bfs::path &path_) : path{path_} {}

path_guard_t::path_guard_t(path_guard_t &&other) : path{std::move(other.path)} { other.path = {}; }

path_guard_t::~path_guard_t() {
    if (!path.empty() && !getenv("SYNCSCHED_TEST_KEEP_PATH")) {
        auto ec = std::error_code();
        bfs::remove_all(path, ec);
    }
}

manual_clock_t::manual_clock_t(const pt::ptime &now) noexcept : value{now} {}

pt::ptime manual_clock_t::now() const noexcept {
    auto lock = std::lock_guard(mutex);
    return value;
}

void manual_clock_t::set(const pt::ptime &now) noexcept {
    auto lock = std::lock_guard(mutex);
    value = now;
}

void data_set_t::put(std::string key) noexcept {
    auto lock = std::lock_guard(mutex);
    keys.emplace(std::move(key));
}

void data_set_t::put(const gr::date &date) noexcept { put(utils::format_date(date)); }

bool data_set_t::has(const std::string &key) const noexcept {
    auto lock = std::lock_guard(mutex);
    return keys.count(key) > 0;
}

bool data_set_t::empty() const noexcept {
    auto lock = std::lock_guard(mutex);
    return keys.empty();
}

std::string read_file(const bfs::path &path) {
    auto file_path = path.string();
    auto file_path_c = file_path.c_str();
    auto in = fopen(file_path_c, "rb");
    if (!in) {
        auto ec = sys::error_code{errno, sys::generic_category()};
        std::cout << "can't open " << file_path_c << " : " << ec.message() << "\n";
        return "";
    }

    fseek(in, 0L, SEEK_END);
    auto filesize = ftell(in);
    fseek(in, 0L, SEEK_SET);
    std::vector<char> buffer(filesize, 0);
    auto r = fread(buffer.data(), filesize, 1, in);
    assert(r == 1 || filesize == 0);
    (void)r;
    fclose(in);
    return std::string(buffer.data(), filesize);
}

void write_file(const bfs::path &path, std::string_view content) {
    bfs::create_directories(path.parent_path());
    auto file_path = path.string();
    auto out = fopen(file_path.c_str(), "wb");
    if (!out) {
        auto ec = sys::error_code{errno, sys::generic_category()};
        std::cout << "can't open " << file_path << " : " << ec.message() << "\n";
        std::abort();
    }
    if (content.size()) {
        auto r = fwrite(content.data(), content.size(), 1, out);
        assert(r);
        (void)r;
    }
    fclose(out);
}

void init_logging() {
    auto dist_sink = utils::create_root_logger();
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    dist_sink->add_sink(console_sink);
}

static std::random_device rd;
static std::uniform_int_distribution<std::uint64_t> dist;

bfs::path unique_path() {
    auto name = fmt::format("tmp-{:016x}", dist(rd));
    return bfs::temp_directory_path() / name;
}

gr::date make_date(std::string_view yyyymmdd) { return utils::parse_date(yyyymmdd).value(); }

pt::ptime make_time(std::string_view yyyymmdd, int hours, int minutes) {
    return pt::ptime(make_date(yyyymmdd), pt::hours(hours) + pt::minutes(minutes));
}

model::calendar_days_t weekdays_calendar(const gr::date &first, const gr::date &last, std::string_view market) {
    auto days = model::calendar_days_t();
    for (auto day = first; day <= last; day += gr::days(1)) {
        auto weekday = day.day_of_week().as_number();
        auto open = weekday != 0 && weekday != 6;
        days.emplace_back(model::calendar_day_t{day, open, std::string(market)});
    }
    return days;
}

model::trade_calendar_ptr_t make_calendar(const gr::date &first, const gr::date &last) {
    auto source = model::calendar_source_ptr_t(new model::memory_calendar_source_t(weekdays_calendar(first, last)));
    auto calendar = model::trade_calendar_ptr_t(new model::trade_calendar_t(source));
    auto r = calendar->refresh();
    REQUIRE(r);
    return calendar;
}

model::probe_ptr_t make_probe(data_set_ptr_t data) {
    return model::make_probe([data](const model::partition_t &partition) -> bool {
        if (partition.is_all_history()) {
            return !data->empty();
        }
        return data->has(partition.key());
    });
}

model::fetcher_ptr_t make_fetcher(data_set_ptr_t data) {
    return model::make_fetcher([data](std::string_view, const model::partition_t &partition) {
        data->put(partition.key());
        return model::fetch_result_t::success(1);
    });
}

model::unit_ptr_t make_unit(model::unit_info_t info, data_set_ptr_t data) {
    return model::unit_t::create(std::move(info), make_fetcher(data), make_probe(data)).value();
}

} // namespace syncsched::test
