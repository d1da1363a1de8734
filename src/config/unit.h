// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace syncsched::config {

struct unit_config_t {
    using names_t = std::vector<std::string>;

    std::string name;
    names_t dependencies;
    names_t optional_dependencies;
    std::string cadence;
    bool enabled;
    bool full_scan;
    std::uint32_t rate_limit;
    std::string fetch_cmd;
    std::string probe_cmd;
};

using unit_configs_t = std::vector<unit_config_t>;

} // namespace syncsched::config
