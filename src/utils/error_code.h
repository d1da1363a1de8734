// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once
#include <string>
#include <system_error>
#include <boost/system/error_code.hpp>
#include "syncsched-export.h"

namespace syncsched::utils {

enum class error_code_t {
    success = 0,
    cant_determine_config_dir,
    unknown_sink,
    misconfigured_default_logger,
    malformed_date,
    malformed_time,
    malformed_json,
    incorrect_json,
    calendar_source_failure,
    command_failure,
};

namespace detail {

class SYNCSCHED_API error_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace detail

SYNCSCHED_API const detail::error_code_category &error_code_category();

inline boost::system::error_code make_error_code(error_code_t e) {
    return {static_cast<int>(e), error_code_category()};
}

} // namespace syncsched::utils

namespace std {
template <> struct is_error_code_enum<syncsched::utils::error_code_t> : std::true_type {};
} // namespace std

namespace boost {
namespace system {

template <> struct is_error_code_enum<syncsched::utils::error_code_t> : std::true_type {
    static const bool value = true;
};

} // namespace system
} // namespace boost
