// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2026 Ivan Baidakou

#pragma once

#include <boost/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

namespace syncsched::model {

/* model objects travel between the scheduling thread and worker threads */
template <typename T> struct arc_base_t : boost::intrusive_ref_counter<T, boost::thread_safe_counter> {
    using parent_t = boost::intrusive_ref_counter<T, boost::thread_safe_counter>;
    using parent_t::parent_t;
    arc_base_t() = default;
    arc_base_t(const arc_base_t &) = delete;
    arc_base_t(arc_base_t &&) = delete;
};

template <typename T> using intrusive_ptr_t = boost::intrusive_ptr<T>;

} // namespace syncsched::model
