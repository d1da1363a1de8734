// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <string>

namespace syncsched::worker::names {

inline std::string worker(std::uint32_t index) { return fmt::format("worker-{}", index); }

} // namespace syncsched::worker::names
