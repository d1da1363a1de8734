// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "syncsched-export.h"

namespace syncsched::core {

struct SYNCSCHED_API names {
    static const char *engine;
    static const char *scheduler;
    static const char *history;
    static const char *detector;
};

} // namespace syncsched::core
