// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once
#include <cstdint>
#include <filesystem>
#include "db.h"
#include "engine.h"
#include "log.h"
#include "scheduler.h"
#include "unit.h"

namespace syncsched::config {

namespace bfs = std::filesystem;

struct main_t {
    bfs::path config_path;
    bfs::path db_dir;
    bfs::path calendar_file;

    log_configs_t log_configs;
    engine_config_t engine_config;
    scheduler_config_t scheduler_config;
    db_config_t db_config;
    unit_configs_t unit_configs;

    std::uint32_t timeout;
};

} // namespace syncsched::config
