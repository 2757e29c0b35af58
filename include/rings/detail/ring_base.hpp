// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_DETAIL_RING_BASE_HPP
#define RINGS_DETAIL_RING_BASE_HPP

#include <algorithm>
#include <iterator>
#include <list>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/range/counting_range.hpp>

#include "rings/util.hpp"
#include "rings/util/index.hpp"

namespace rings::detail {

// Storage and navigation shared by the array-backed rings.
//
// Ring is the derived type (CRTP). Every operation copies the ring, adjusts the copy and returns
// it, so the derived type is what callers get back. Derived rings that track extra per-index state
// hook into structural changes by defining
//
//   void after_prepend_(int count)
//   void after_remove_(int index)
//
// which are called on the copy after elements_ and focused_ have been updated. Defaults below do
// nothing.
template <                   //
    typename T,              // element type
    typename Ring            // self type (CRTP)
    >
class ring_base {
public:
    using value_type = T;

    int size() const { return size_of(elements_); }

    bool is_empty() const { return elements_.empty(); }

    // Structure

    Ring push(T x) const {
        Ring ring = self();
        ring.elements_.push_back(std::move(x));
        return ring;
    }

    Ring append(const std::vector<T>& xs) const {
        Ring ring = self();
        ring.elements_.insert(end(ring.elements_), begin(xs), end(xs));
        return ring;
    }

    Ring prepend(const std::vector<T>& xs) const {
        Ring ring = self();
        const int count = size_of(xs);
        ring.elements_.insert(begin(ring.elements_), begin(xs), end(xs));
        if (!is_empty()) {
            ring.focused_ += count;
            ring.after_prepend_(count);
        }
        return ring;
    }

    // Focus index is kept as is unless the last element goes away, in which case it steps back.
    // Removing an element before the focus therefore moves the focus one element forward in terms
    // of contents. An index left past the end is clamped to the new last element.
    Ring remove_at(int i) const {
        if (is_empty()) {
            return self();
        }
        const int n = size();
        const int index = normalize(i);

        Ring ring = self();
        ring.elements_.erase(begin(ring.elements_) + index);

        const int m = n - 1;
        if (m == 0) {
            ring.focused_ = 0;
        } else if (index == n - 1) {
            ring.focused_ = util::normalize_index(focused_ - 1, m);
        } else if (focused_ >= m) {
            ring.focused_ = m - 1;
        }
        ring.after_remove_(index);
        return ring;
    }

    Ring remove_first() const { return remove_at(0); }

    Ring remove_last() const { return remove_at(size() - 1); }

    Ring remove_focused() const { return remove_at(focused_); }

    // Navigation

    Ring focus_on(int i) const {
        if (is_empty()) {
            return self();
        }
        return with_focus_(normalize(i));
    }

    Ring focus_on_next() const { return focus_on(focused_ + 1); }

    Ring focus_on_previous() const { return focus_on(focused_ - 1); }

    Ring focus_on_first() const { return focus_on(0); }

    Ring focus_on_last() const { return focus_on(size() - 1); }

    template <typename Pred>
    Ring focus_on_first_matching(Pred&& pred) const {
        return focus_on_found_(util::find_first_index(elements_, pred));
    }

    template <typename Pred>
    Ring focus_on_last_matching(Pred&& pred) const {
        return focus_on_found_(util::find_last_index(elements_, pred));
    }

    template <typename Pred>
    Ring focus_on_next_matching(Pred&& pred) const {
        return focus_on_found_(util::find_next_index(elements_, focused_, pred));
    }

    template <typename Pred>
    Ring focus_on_previous_matching(Pred&& pred) const {
        return focus_on_found_(util::find_previous_index(elements_, focused_, pred));
    }

    // Access

    std::optional<T> get(int i) const {
        if (is_empty()) {
            return {};
        }
        return elements_[normalize(i)];
    }

    std::optional<T> get_first() const { return get(0); }

    std::optional<T> get_last() const { return get(size() - 1); }

    std::optional<T> get_focused() const { return get(focused_); }

    int get_focused_index() const { return focused_; }

    bool is_focused_at(int i) const { return !is_empty() && normalize(i) == focused_; }

    template <typename Pred>
    bool is_focused_matching(Pred&& pred) const {
        return !is_empty() && pred(elements_[focused_]);
    }

    Ring set(int i, T x) const {
        if (is_empty()) {
            return self();
        }
        Ring ring = self();
        ring.elements_[normalize(i)] = std::move(x);
        return ring;
    }

    Ring set_focused(T x) const { return set(focused_, std::move(x)); }

    std::list<T> to_list() const { return std::list<T>(begin(elements_), end(elements_)); }

    std::vector<T> to_array() const { return elements_; }

    template <typename F>
    auto map_focused(F&& f) const -> std::optional<std::invoke_result_t<F, const T&>> {
        if (is_empty()) {
            return {};
        }
        return f(elements_[focused_]);
    }

protected:
    std::vector<T> elements_;
    int focused_ = 0;

    ring_base() = default;

    explicit ring_base(std::vector<T> elements, int focused = 0)
    : elements_(std::move(elements))
    , focused_(elements_.empty() ? 0 : util::normalize_index(focused, size_of(elements_))) { }

    int normalize(int i) const { return util::normalize_index(i, size()); }

    void after_prepend_(int /* count */) { }

    void after_remove_(int /* index */) { }

    template <typename U, typename F>
    std::vector<U> map_elements_(F&& f) const {
        auto out = std::vector<U>{};
        out.reserve(elements_.size());
        std::transform(begin(elements_), end(elements_), std::back_inserter(out), f);
        return out;
    }

    // Index-wise traversal behind the map_each_into_* family, apply(i, x) yields the output for
    // element i.
    template <typename Out, typename Apply>
    Out map_each_(Apply&& apply) const {
        auto out = Out{};
        for (int i : boost::counting_range(0, size())) {
            out.push_back(apply(i, elements_[i]));
        }
        return out;
    }

    template <typename U>
    static std::list<U> as_list_(std::vector<U> xs) {
        return std::list<U>(std::make_move_iterator(begin(xs)), std::make_move_iterator(end(xs)));
    }

    bool same_elements_and_focus_(const ring_base& other) const {
        return focused_ == other.focused_ && elements_ == other.elements_;
    }

private:
    const Ring& self() const { return static_cast<const Ring&>(*this); }

    Ring with_focus_(int index) const {
        Ring ring = self();
        ring.focused_ = index;
        return ring;
    }

    Ring focus_on_found_(std::optional<int> index) const {
        if (!index) {
            return self();
        }
        return with_focus_(*index);
    }
};

}  // namespace rings::detail

#endif  // RINGS_DETAIL_RING_BASE_HPP
