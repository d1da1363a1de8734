// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include "mdbx.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "syncsched-export.h"

namespace syncsched::db {

using discr_t = std::byte;

namespace prefix {
// clang-format off
static const constexpr discr_t misc           {0x01};
static const constexpr discr_t record         {0x20};
// clang-format on
} // namespace prefix

struct SYNCSCHED_API value_t {
    std::string bytes;
    MDBX_val value;

    template <typename T> value_t(T &&bytes_) noexcept : bytes{std::forward<T>(bytes_)} {
        value.iov_base = bytes.data();
        value.iov_len = bytes.length();
    }

    inline operator MDBX_val *() noexcept { return &value; }
    inline operator const MDBX_val *() const noexcept { return &value; }
};

template <discr_t> struct prefixer_t;

template <> struct prefixer_t<prefix::misc> {
    static SYNCSCHED_API value_t make(std::string_view name) noexcept;
};

/** `prefix | completed_at (big endian microseconds) | task id (big endian)`, ordered by completion time */
template <> struct prefixer_t<prefix::record> {
    static constexpr std::size_t size = 1 + sizeof(std::int64_t) + sizeof(std::uint64_t);

    static SYNCSCHED_API value_t make(std::int64_t completed_at, std::uint64_t task_id) noexcept;
    /** the smallest key of records completed at or after the timestamp */
    static SYNCSCHED_API value_t lower_bound(std::int64_t completed_at) noexcept;
    static SYNCSCHED_API std::int64_t get_completed_at(std::string_view key) noexcept;
};

} // namespace syncsched::db
