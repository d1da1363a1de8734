// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "model/task.h"
#include <rotor.hpp>

namespace syncsched {
namespace worker {

namespace r = rotor;

namespace payload {

struct execute_t {
    model::task_ptr_t task;
    r::address_ptr_t back_addr;
};

struct executed_t {
    model::task_ptr_t task;
    model::task_status_t status;
    std::uint32_t worker;
};

} // namespace payload

namespace message {

using execute_t = r::message_t<payload::execute_t>;
using executed_t = r::message_t<payload::executed_t>;

} // namespace message

} // namespace worker
} // namespace syncsched
