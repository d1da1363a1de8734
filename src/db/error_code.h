// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include <boost/system/error_code.hpp>
#include "syncsched-export.h"

namespace syncsched {
namespace db {

enum class error_code_t {
    success = 0,
    db_version_size_mismatch,
    cannot_downgrade_db,
    not_opened,
};

namespace detail {

class SYNCSCHED_API db_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

class SYNCSCHED_API mdbx_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace detail

SYNCSCHED_API const detail::db_code_category &db_code_category();

SYNCSCHED_API const detail::mdbx_code_category &mdbx_code_category();

/** mdbx native return code */
inline boost::system::error_code make_error_code(int e) { return {e, mdbx_code_category()}; }
inline boost::system::error_code make_error_code(error_code_t ec) { return {static_cast<int>(ec), db_code_category()}; }

} // namespace db
} // namespace syncsched

namespace std {
template <> struct is_error_code_enum<syncsched::db::error_code_t> : std::true_type {};
} // namespace std

namespace boost {
namespace system {

template <> struct is_error_code_enum<syncsched::db::error_code_t> : std::true_type {
    static const bool value = true;
};

} // namespace system
} // namespace boost
