// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include <cstdint>

namespace syncsched::config {

struct db_config_t {
    /** mdbx geometry upper limit, 0 for auto-adjust */
    std::int64_t upper_limit;
};

} // namespace syncsched::config
