// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include <mdbx.h>
#include "syncsched-export.h"
#include <boost/outcome.hpp>
#include <optional>
#include <string_view>
#include <utility>

namespace syncsched {
namespace db {

namespace outcome = boost::outcome_v2;

struct transaction_t;

struct SYNCSCHED_API cursor_t {
    using entry_t = std::pair<std::string_view, std::string_view>;
    using entry_opt_t = std::optional<entry_t>;
    using entry_result_t = outcome::result<entry_opt_t>;

    cursor_t(cursor_t &&other) noexcept;
    ~cursor_t();

    /** the first entry with key not less than `from`, none past the end */
    entry_result_t seek(std::string_view from) noexcept;
    entry_result_t next() noexcept;

    /** \brief visits records starting from the `from` key while keys start with `from[0]`
     *
     * The visitor is `outcome::result<bool>(std::string_view key, std::string_view value)`,
     * returning `false` stops the iteration. The views are valid during the visit only.
     */
    template <typename F> outcome::result<void> iterate(std::string_view from, F &&f) noexcept {
        auto prefix = from.front();
        auto entry = seek(from);
        while (entry && entry.value()) {
            auto &[key, value] = *entry.value();
            if (key.empty() || key.front() != prefix) {
                break;
            }
            auto r = f(key, value);
            if (!r) {
                return r.error();
            }
            if (!r.value()) {
                break;
            }
            entry = next();
        }
        if (!entry) {
            return entry.error();
        }
        return outcome::success();
    }

  private:
    cursor_t(MDBX_cursor *impl_) noexcept : impl{impl_} {}
    entry_result_t get(MDBX_val &key, MDBX_cursor_op op) noexcept;

    MDBX_cursor *impl = nullptr;
    friend struct transaction_t;
};

} // namespace db
} // namespace syncsched
