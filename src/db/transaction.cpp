// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#include "transaction.h"
#include "error_code.h"
#include <utility>

namespace syncsched::db {

transaction_t::transaction_t(transaction_t &&other) noexcept
    : txn{std::exchange(other.txn, nullptr)}, dbi{other.dbi}, type{other.type} {}

transaction_t::~transaction_t() {
    if (txn) {
        mdbx_txn_abort(txn);
    }
}

static outcome::result<void> finish(MDBX_txn *&txn, int (*fn)(MDBX_txn *)) noexcept {
    auto r = fn(std::exchange(txn, nullptr));
    if (r != MDBX_SUCCESS) {
        return make_error_code(r);
    }
    return outcome::success();
}

outcome::result<void> transaction_t::commit() noexcept { return finish(txn, &mdbx_txn_commit); }

outcome::result<void> transaction_t::abort() noexcept { return finish(txn, &mdbx_txn_abort); }

outcome::result<cursor_t> transaction_t::cursor() noexcept {
    MDBX_cursor *c = nullptr;
    auto r = mdbx_cursor_open(txn, dbi, &c);
    if (r != MDBX_SUCCESS) {
        return make_error_code(r);
    }
    return cursor_t(c);
}

outcome::result<transaction_t> make_transaction(transaction_type_t type, MDBX_env *env) noexcept {
    auto flags = type == transaction_type_t::RO ? MDBX_TXN_RDONLY : MDBX_TXN_READWRITE;
    MDBX_txn *txn = nullptr;
    auto r = mdbx_txn_begin(env, nullptr, flags, &txn);
    if (r != MDBX_SUCCESS) {
        return make_error_code(r);
    }

    MDBX_dbi dbi;
    r = mdbx_dbi_open(txn, nullptr, MDBX_DB_DEFAULTS, &dbi);
    if (r != MDBX_SUCCESS) {
        mdbx_txn_abort(txn);
        return make_error_code(r);
    }
    return transaction_t(type, txn, dbi);
}

} // namespace syncsched::db
