// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include "mdbx.h"
#include "cursor.h"
#include <boost/outcome.hpp>
#include "syncsched-export.h"

namespace syncsched {
namespace db {

namespace outcome = boost::outcome_v2;

enum class transaction_type_t { RO, RW };

struct transaction_t;

SYNCSCHED_API outcome::result<transaction_t> make_transaction(transaction_type_t type, MDBX_env *env) noexcept;

/** \struct transaction_t
 *  \brief RAII over mdbx transaction over the default database
 *
 * Writes are persisted by an explicit `commit()`, a transaction which is
 * still open on destruction is aborted.
 */
struct SYNCSCHED_API transaction_t {
    transaction_t(transaction_t &&other) noexcept;
    transaction_t(const transaction_t &) = delete;
    ~transaction_t();

    outcome::result<void> commit() noexcept;
    outcome::result<void> abort() noexcept;
    outcome::result<cursor_t> cursor() noexcept;

    MDBX_txn *txn = nullptr;
    MDBX_dbi dbi = 0;
    transaction_type_t type = transaction_type_t::RO;

  private:
    transaction_t(transaction_type_t type_, MDBX_txn *txn_, MDBX_dbi dbi_) noexcept
        : txn{txn_}, dbi{dbi_}, type{type_} {}

    friend outcome::result<transaction_t> make_transaction(transaction_type_t type, MDBX_env *env) noexcept;
};

} // namespace db
} // namespace syncsched
