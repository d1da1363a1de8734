// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include <boost/system/error_code.hpp>
#include "syncsched-export.h"

namespace syncsched::model {

enum class error_code_t {
    success = 0,
    calendar_unavailable,
    empty_unit_name,
    unit_already_registered,
    unknown_unit,
    cyclic_dependency,
    dependency_not_satisfied,
    partition_fetch_transient,
    partition_fetch_permanent,
    task_not_found,
    task_cancelled,
    shutting_down,
    no_partitions,
    sync_in_progress,
    record_deserialization_failure,
    invalid_record_key,
};

namespace detail {

class SYNCSCHED_API error_code_category_t : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace detail

SYNCSCHED_API const detail::error_code_category_t &error_code_category();

inline boost::system::error_code make_error_code(error_code_t e) {
    return {static_cast<int>(e), error_code_category()};
}

} // namespace syncsched::model

namespace std {
template <> struct is_error_code_enum<syncsched::model::error_code_t> : std::true_type {};
} // namespace std

namespace boost {
namespace system {

template <> struct is_error_code_enum<syncsched::model::error_code_t> : std::true_type {
    static const bool value = true;
};

} // namespace system
} // namespace boost
