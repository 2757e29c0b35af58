// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_UTIL_INDEX_HPP
#define RINGS_UTIL_INDEX_HPP

#include <optional>

#include <boost/range/counting_range.hpp>

#include "rings/util.hpp"

namespace rings::util {

// Floored modulo - maps any integer onto [0, n). Degenerate for n <= 0, where it yields 0.
constexpr int normalize_index(int i, int n) noexcept {
    if (n <= 0) {
        return 0;
    }
    return ((i % n) + n) % n;
}

namespace impl {

// Lowest index in [first, last) whose element satisfies pred.
template <typename Seq, typename Pred>
std::optional<int> scan_up(const Seq& xs, int first, int last, Pred& pred) {
    for (int i : boost::counting_range(first, last)) {
        if (pred(xs[i])) {
            return i;
        }
    }
    return {};
}

// Highest index in [first, last) whose element satisfies pred.
template <typename Seq, typename Pred>
std::optional<int> scan_down(const Seq& xs, int first, int last, Pred& pred) {
    for (int i = last - 1; i >= first; --i) {
        if (pred(xs[i])) {
            return i;
        }
    }
    return {};
}

}  // namespace impl

template <typename Seq, typename Pred>
std::optional<int> find_first_index(const Seq& xs, Pred&& pred) {
    return impl::scan_up(xs, 0, size_of(xs), pred);
}

template <typename Seq, typename Pred>
std::optional<int> find_last_index(const Seq& xs, Pred&& pred) {
    return impl::scan_down(xs, 0, size_of(xs), pred);
}

// Searches strictly after `from` first, then wraps around to [0, from].
template <typename Seq, typename Pred>
std::optional<int> find_next_index(const Seq& xs, int from, Pred&& pred) {
    const int n = size_of(xs);
    if (n == 0) {
        return {};
    }
    if (auto after = impl::scan_up(xs, from + 1, n, pred)) {
        return after;
    }
    return impl::scan_up(xs, 0, from + 1, pred);
}

// Searches [0, from] backwards first, so `from` itself is a candidate, then wraps around to
// (from, n) backwards.
template <typename Seq, typename Pred>
std::optional<int> find_previous_index(const Seq& xs, int from, Pred&& pred) {
    const int n = size_of(xs);
    if (n == 0) {
        return {};
    }
    if (auto before = impl::scan_down(xs, 0, from + 1, pred)) {
        return before;
    }
    return impl::scan_down(xs, from + 1, n, pred);
}

}  // namespace rings::util

#endif  // RINGS_UTIL_INDEX_HPP
