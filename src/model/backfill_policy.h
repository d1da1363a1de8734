// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 Ivan Baidakou

#pragma once

#include "execution_record.h"
#include "partition.h"
#include <cstdint>
#include <string_view>
#include "syncsched-export.h"

namespace syncsched::model {

enum class decision_t { incremental, backfill, skip_alert };

SYNCSCHED_API std::string_view to_string(decision_t value) noexcept;

/** task shape chosen for a unit */
struct task_shape_t {
    decision_t decision;
    task_kind_t kind;
    /** empty for skip */
    partitions_t partitions;
    std::size_t missing_count;
};

/** \struct backfill_policy_t
 *  \brief smart backfill: auto-heal small gaps, refuse to auto-heal large ones
 *
 * Zero missing dates give an incremental task for `today`; up to `threshold`
 * missing dates give a backfill task of the missing dates plus `today`;
 * larger gaps are skipped and must be investigated manually.
 */
struct SYNCSCHED_API backfill_policy_t {
    static constexpr std::uint32_t default_threshold = 3;

    explicit backfill_policy_t(std::uint32_t threshold = default_threshold) noexcept : threshold{threshold} {}

    task_shape_t decide(const dates_t &missing, const gr::date &today) const noexcept;

    inline std::uint32_t get_threshold() const noexcept { return threshold; }

  private:
    std::uint32_t threshold;
};

} // namespace syncsched::model
