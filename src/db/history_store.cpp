// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#include "history_store.h"
#include "transaction.h"
#include "prefix.h"
#include "error_code.h"
#include "utils/time.h"
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <cstring>
#include <limits>
#include <vector>

namespace syncsched::db {

namespace be = boost::endian;

const std::uint32_t history_store_t::version{1};

namespace misc {
static const constexpr std::string_view db_version = "db_version";
}

static outcome::result<std::uint32_t> read_version(transaction_t &txn) noexcept {
    auto key = prefixer_t<prefix::misc>::make(misc::db_version);
    MDBX_val value;
    auto r = mdbx_get(txn.txn, txn.dbi, key, &value);
    if (r != MDBX_SUCCESS) {
        if (r == MDBX_NOTFOUND) {
            return outcome::success(0);
        }
        return make_error_code(r);
    }

    if (value.iov_len != sizeof(std::uint32_t)) {
        return make_error_code(error_code_t::db_version_size_mismatch);
    }

    std::uint32_t version;
    memcpy(&version, value.iov_base, sizeof(std::uint32_t));
    be::big_to_native_inplace(version);
    return version;
}

static outcome::result<void> save_version(std::uint32_t v, transaction_t &txn) noexcept {
    auto key = prefixer_t<prefix::misc>::make(misc::db_version);
    MDBX_val value;
    auto db_ver = be::native_to_big(v);
    value.iov_base = &db_ver;
    value.iov_len = sizeof(db_ver);
    auto r = mdbx_put(txn.txn, txn.dbi, key, &value, MDBX_UPSERT);
    if (r != MDBX_SUCCESS) {
        return make_error_code(r);
    }
    return outcome::success();
}

bool history_filter_t::matches(const model::execution_record_t &record) const noexcept {
    if (unit && *unit != record.unit) {
        return false;
    }
    if (status && *status != record.status) {
        return false;
    }
    if (kind && *kind != record.kind) {
        return false;
    }
    if (trigger && *trigger != record.trigger) {
        return false;
    }
    if (!completed_from.is_special() && record.completed_at < completed_from) {
        return false;
    }
    if (!completed_to.is_special() && record.completed_at > completed_to) {
        return false;
    }
    return true;
}

history_store_t::history_store_t(bfs::path db_dir_, config::db_config_t config_) noexcept
    : db_dir{std::move(db_dir_)}, config{config_} {
    log = utils::get_logger("db.history");
}

history_store_t::~history_store_t() {
    if (env) {
        mdbx_env_close(env);
    }
}

outcome::result<void> history_store_t::open() noexcept {
    auto r = mdbx_env_create(&env);
    if (r != MDBX_SUCCESS) {
        LOG_CRITICAL(log, "mdbx environment creation error ({}): {}", r, mdbx_strerror(r));
        env = nullptr;
        return make_error_code(r);
    }

    auto fail = [&](int r) -> outcome::result<void> {
        mdbx_env_close(env);
        env = nullptr;
        return make_error_code(r);
    };

    auto upper_limit = config.upper_limit ? static_cast<intptr_t>(config.upper_limit) : intptr_t(-1);
    LOG_DEBUG(log, "open, db upper limit = {}", config.upper_limit);
    r = mdbx_env_set_geometry(env, -1, -1, upper_limit, -1, -1, -1);
    if (r != MDBX_SUCCESS) {
        LOG_ERROR(log, "open, mdbx set geometry error ({}): {}", r, mdbx_strerror(r));
        return fail(r);
    }

    std::error_code ec;
    bfs::create_directories(db_dir, ec);
    if (ec) {
        LOG_ERROR(log, "open, cannot create '{}': {}", db_dir.string(), ec.message());
        return fail(ec.value());
    }

    auto flags = MDBX_WRITEMAP | MDBX_LIFORECLAIM | MDBX_EXCLUSIVE | MDBX_NOSTICKYTHREADS | MDBX_SAFE_NOSYNC;
    r = mdbx_env_open(env, db_dir.string().c_str(), flags, 0664);
    if (r != MDBX_SUCCESS) {
        LOG_ERROR(log, "open, mdbx open environment error ({}): {}, path: {}", r, mdbx_strerror(r), db_dir.string());
        return fail(r);
    }

    auto txn = make_transaction(transaction_type_t::RW, env);
    if (!txn) {
        LOG_ERROR(log, "open, cannot create transaction {}", txn.error().message());
        mdbx_env_close(env);
        env = nullptr;
        return txn.error();
    }
    auto close = [&](const boost::system::error_code &ec) -> outcome::result<void> {
        auto &t = txn.value();
        if (t.txn) {
            auto r = t.abort();
            if (!r) {
                LOG_WARN(log, "open, cannot abort transaction: {}", r.error().message());
            }
        }
        mdbx_env_close(env);
        env = nullptr;
        return ec;
    };

    auto db_ver = read_version(txn.value());
    if (!db_ver) {
        LOG_ERROR(log, "open, cannot get db version :: {}", db_ver.error().message());
        return close(db_ver.error());
    }
    if (db_ver.value() > version) {
        LOG_ERROR(log, "open, db version {} is newer than supported {}", db_ver.value(), version);
        return close(make_error_code(error_code_t::cannot_downgrade_db));
    }
    if (db_ver.value() != version) {
        auto ok = save_version(version, txn.value());
        if (!ok) {
            LOG_ERROR(log, "open, cannot save db version :: {}", ok.error().message());
            return close(ok.error());
        }
        LOG_INFO(log, "open, db version: {} -> {}", db_ver.value(), version);
    }
    auto ok = txn.value().commit();
    if (!ok) {
        LOG_ERROR(log, "open, cannot commit :: {}", ok.error().message());
        return close(ok.error());
    }
    LOG_INFO(log, "history database has been opened at {}", db_dir.string());
    return outcome::success();
}

outcome::result<std::uint32_t> history_store_t::get_version() noexcept {
    if (!env) {
        return make_error_code(error_code_t::not_opened);
    }
    auto txn = make_transaction(transaction_type_t::RO, env);
    if (!txn) {
        return txn.error();
    }
    return read_version(txn.value());
}

outcome::result<void> history_store_t::record(const model::execution_record_t &record) noexcept {
    if (!env) {
        return make_error_code(error_code_t::not_opened);
    }
    auto &at = record.completed_at.is_special() ? record.created_at : record.completed_at;
    auto key = prefixer_t<prefix::record>::make(utils::as_microseconds(at), record.id);
    auto data = value_t(record.serialize());

    auto txn = make_transaction(transaction_type_t::RW, env);
    if (!txn) {
        return txn.error();
    }
    auto r = mdbx_put(txn.value().txn, txn.value().dbi, key, data, MDBX_UPSERT);
    if (r != MDBX_SUCCESS) {
        LOG_ERROR(log, "cannot store record of task {}: {}", record.id, mdbx_strerror(r));
        return make_error_code(r);
    }
    LOG_TRACE(log, "recorded task {} ({}, {})", record.id, record.unit, model::to_string(record.status));
    return txn.value().commit();
}

outcome::result<history_page_t> history_store_t::query(const history_query_t &query) noexcept {
    if (!env) {
        return make_error_code(error_code_t::not_opened);
    }
    auto txn = make_transaction(transaction_type_t::RO, env);
    if (!txn) {
        return txn.error();
    }
    auto cursor = txn.value().cursor();
    if (!cursor) {
        return cursor.error();
    }

    auto &filter = query.filter;
    auto from = filter.completed_from.is_special() ? std::numeric_limits<std::int64_t>::min()
                                                   : utils::as_microseconds(filter.completed_from);
    auto start = prefixer_t<prefix::record>::lower_bound(from);
    auto matched = model::execution_records_t();
    auto ok = cursor.value().iterate(start.bytes, [&](std::string_view, std::string_view value) -> outcome::result<bool> {
        auto record = model::execution_record_t::deserialize(value);
        if (!record) {
            LOG_WARN(log, "skipping malformed record: {}", record.error().message());
            return true;
        }
        auto &r = record.value();
        if (!filter.completed_to.is_special() && r.completed_at > filter.completed_to) {
            return false;
        }
        if (filter.matches(r)) {
            matched.emplace_back(std::move(r));
        }
        return true;
    });
    if (!ok) {
        return ok.error();
    }

    switch (query.sort) {
    case sort_t::completed_asc:
        break;
    case sort_t::completed_desc:
        std::reverse(matched.begin(), matched.end());
        break;
    case sort_t::unit:
        std::stable_sort(matched.begin(), matched.end(), [](auto &a, auto &b) { return a.unit < b.unit; });
        break;
    case sort_t::status:
        std::stable_sort(matched.begin(), matched.end(), [](auto &a, auto &b) { return a.status < b.status; });
        break;
    }

    auto page = history_page_t{};
    page.total = matched.size();
    if (query.offset < matched.size()) {
        auto first = matched.begin() + static_cast<std::ptrdiff_t>(query.offset);
        auto count = std::min(query.limit, matched.size() - query.offset);
        auto last = first + static_cast<std::ptrdiff_t>(count);
        page.records.assign(std::make_move_iterator(first), std::make_move_iterator(last));
    }
    return page;
}

outcome::result<std::size_t> history_store_t::cleanup_older_than(std::uint32_t days, const pt::ptime &now) noexcept {
    if (!env) {
        return make_error_code(error_code_t::not_opened);
    }
    auto cutoff = utils::as_microseconds(now - pt::hours(24 * static_cast<long>(days)));
    auto txn = make_transaction(transaction_type_t::RW, env);
    if (!txn) {
        return txn.error();
    }

    auto keys = std::vector<std::string>();
    {
        auto cursor = txn.value().cursor();
        if (!cursor) {
            return cursor.error();
        }
        auto start = prefixer_t<prefix::record>::lower_bound(std::numeric_limits<std::int64_t>::min());
        auto ok = cursor.value().iterate(start.bytes, [&](std::string_view key, std::string_view) -> outcome::result<bool> {
            if (key.size() != prefixer_t<prefix::record>::size) {
                return true;
            }
            if (prefixer_t<prefix::record>::get_completed_at(key) >= cutoff) {
                return false;
            }
            keys.emplace_back(key);
            return true;
        });
        if (!ok) {
            return ok.error();
        }
    }

    for (auto &key : keys) {
        auto k = value_t(key);
        auto r = mdbx_del(txn.value().txn, txn.value().dbi, k, nullptr);
        if (r != MDBX_SUCCESS) {
            LOG_ERROR(log, "cannot remove record: {}", mdbx_strerror(r));
            if (auto aborted = txn.value().abort(); !aborted) {
                LOG_ERROR(log, "cannot abort transaction: {}", aborted.error().message());
            }
            return make_error_code(r);
        }
    }
    auto ok = txn.value().commit();
    if (!ok) {
        return ok.error();
    }
    LOG_INFO(log, "removed {} record(s) older than {} days", keys.size(), days);
    return keys.size();
}

} // namespace syncsched::db
