// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include <rotor/actor_base.h>
#include "core/engine_actor.h"
#include "core/scheduler_actor.h"

namespace syncsched::test {
namespace {
namespace to {
struct state {};
struct jobs {};
struct concurrency {};
} // namespace to
} // namespace
} // namespace syncsched::test

namespace syncsched::core {

template <> inline auto &scheduler_actor_t::access<test::to::jobs>() noexcept { return jobs; }
template <> inline auto &engine_actor_t::access<test::to::concurrency>() noexcept { return concurrency; }

} // namespace syncsched::core

namespace rotor {

template <> inline auto &actor_base_t::access<syncsched::test::to::state>() noexcept { return state; }

} // namespace rotor
