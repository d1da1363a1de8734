// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <boost/outcome.hpp>
#include "main.h"
#include "syncsched-export.h"

namespace syncsched::config {

namespace outcome = boost::outcome_v2;

using config_result_t = outcome::outcome<main_t, std::string>;

SYNCSCHED_API config_result_t get_config(std::istream &config, const bfs::path &config_path);

SYNCSCHED_API outcome::result<main_t> generate_config(const bfs::path &config_path);

SYNCSCHED_API outcome::result<void> serialize(const main_t cfg, std::ostream &out) noexcept;

SYNCSCHED_API std::string_view to_string(frequency_t value) noexcept;

} // namespace syncsched::config
