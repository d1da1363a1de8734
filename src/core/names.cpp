// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "names.h"

using namespace syncsched::core;

const char *names::engine = "core.engine";
const char *names::scheduler = "core.scheduler";
const char *names::history = "core.history";
const char *names::detector = "core.detector";
