// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "prefix.h"
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <cstring>

using namespace syncsched::db;

namespace be = boost::endian;

static value_t mk(discr_t prefix, std::string_view name) noexcept {
    std::string r;
    r.resize(name.size() + 1);
    *r.data() = (char)prefix;
    std::copy(name.begin(), name.end(), r.begin() + 1);
    return r;
}

value_t prefixer_t<prefix::misc>::make(std::string_view name) noexcept { return mk(prefix::misc, name); }

// timestamps before the epoch are not expected, the sign bit is flipped to keep the ordering anyway
static std::uint64_t to_ordered(std::int64_t value) noexcept {
    return static_cast<std::uint64_t>(value) ^ (std::uint64_t{1} << 63);
}

value_t prefixer_t<prefix::record>::make(std::int64_t completed_at, std::uint64_t task_id) noexcept {
    std::string r;
    r.resize(size);
    *r.data() = (char)prefix::record;
    auto ts = be::native_to_big(to_ordered(completed_at));
    auto id = be::native_to_big(task_id);
    std::memcpy(r.data() + 1, &ts, sizeof(ts));
    std::memcpy(r.data() + 1 + sizeof(ts), &id, sizeof(id));
    return r;
}

value_t prefixer_t<prefix::record>::lower_bound(std::int64_t completed_at) noexcept { return make(completed_at, 0); }

std::int64_t prefixer_t<prefix::record>::get_completed_at(std::string_view key) noexcept {
    std::uint64_t ts;
    std::memcpy(&ts, key.data() + 1, sizeof(ts));
    be::big_to_native_inplace(ts);
    return static_cast<std::int64_t>(ts ^ (std::uint64_t{1} << 63));
}
