// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "cursor.h"
#include "error_code.h"

namespace syncsched::db {

static std::string_view as_view(const MDBX_val &value) noexcept {
    return {reinterpret_cast<const char *>(value.iov_base), value.iov_len};
}

cursor_t::cursor_t(cursor_t &&other) noexcept : impl{std::exchange(other.impl, nullptr)} {}

cursor_t::~cursor_t() {
    if (impl) {
        mdbx_cursor_close(impl);
    }
}

auto cursor_t::get(MDBX_val &key, MDBX_cursor_op op) noexcept -> entry_result_t {
    MDBX_val value;
    auto r = mdbx_cursor_get(impl, &key, &value, op);
    if (r == MDBX_NOTFOUND) {
        return entry_opt_t{};
    }
    if (r != MDBX_SUCCESS) {
        return make_error_code(r);
    }
    return entry_opt_t{entry_t{as_view(key), as_view(value)}};
}

auto cursor_t::seek(std::string_view from) noexcept -> entry_result_t {
    MDBX_val key;
    key.iov_base = const_cast<char *>(from.data());
    key.iov_len = from.size();
    return get(key, MDBX_SET_RANGE);
}

auto cursor_t::next() noexcept -> entry_result_t {
    MDBX_val key;
    return get(key, MDBX_NEXT);
}

} // namespace syncsched::db
