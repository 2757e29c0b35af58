// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_MULTI_SELECT_RING_HPP
#define RINGS_MULTI_SELECT_RING_HPP

#include <list>
#include <set>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/range/counting_range.hpp>

#include "rings/detail/ring_base.hpp"
#include "rings/util.hpp"

namespace rings {

// Focus ring with any number of selected elements.
//
// Selected indices are kept in an ordered set, so selecting is idempotent and selected elements
// always come out in ring order.
template <typename T>
class multi_select_ring : public detail::ring_base<T, multi_select_ring<T>> {
private:
    using base = detail::ring_base<T, multi_select_ring<T>>;
    using index_set = std::set<int>;

    friend base;

    template <typename>
    friend class multi_select_ring;

    index_set selected_;

    multi_select_ring(std::vector<T> elements, int focused, index_set selected)
    : base{std::move(elements), focused}
    , selected_{std::move(selected)} { }

    void after_prepend_(int count) {
        auto shifted = index_set{};
        for (int i : selected_) {
            shifted.insert(shifted.end(), i + count);
        }
        selected_ = std::move(shifted);
    }

    void after_remove_(int index) {
        auto shifted = index_set{};
        for (int i : selected_) {
            if (i < index) {
                shifted.insert(shifted.end(), i);
            } else if (i > index) {
                shifted.insert(shifted.end(), i - 1);
            }
        }
        selected_ = std::move(shifted);
    }

    template <typename Update>
    multi_select_ring with_selection_(Update&& update) const {
        multi_select_ring ring = *this;
        if (!this->is_empty()) {
            update(ring.selected_);
        }
        return ring;
    }

public:
    multi_select_ring() = default;

    static multi_select_ring empty() { return {}; }

    static multi_select_ring singleton(T x) {
        auto elements = std::vector<T>{};
        elements.push_back(std::move(x));
        return {std::move(elements), 0, {}};
    }

    static multi_select_ring from_array(std::vector<T> items) {
        return {std::move(items), 0, {}};
    }

    static multi_select_ring from_list(const std::list<T>& items) {
        return {std::vector<T>(begin(items), end(items)), 0, {}};
    }

    // Selection

    multi_select_ring select_at(int i) const {
        return with_selection_([&](index_set& s) { s.insert(this->normalize(i)); });
    }

    multi_select_ring select_first() const { return select_at(0); }

    multi_select_ring select_last() const { return select_at(this->size() - 1); }

    multi_select_ring select_focused() const { return select_at(this->focused_); }

    multi_select_ring select_all() const {
        return with_selection_([&](index_set& s) {
            for (int i : boost::counting_range(0, this->size())) {
                s.insert(i);
            }
        });
    }

    multi_select_ring select_many(const std::vector<int>& indices) const {
        return with_selection_([&](index_set& s) {
            for (int i : indices) {
                s.insert(this->normalize(i));
            }
        });
    }

    template <typename Pred>
    multi_select_ring select_many_matching(Pred&& pred) const {
        return with_selection_([&](index_set& s) {
            for (int i : boost::counting_range(0, this->size())) {
                if (pred(this->elements_[i])) {
                    s.insert(i);
                }
            }
        });
    }

    multi_select_ring deselect_at(int i) const {
        return with_selection_([&](index_set& s) { s.erase(this->normalize(i)); });
    }

    multi_select_ring deselect_first() const { return deselect_at(0); }

    multi_select_ring deselect_last() const { return deselect_at(this->size() - 1); }

    multi_select_ring deselect_focused() const { return deselect_at(this->focused_); }

    multi_select_ring deselect_all() const {
        return with_selection_([](index_set& s) { s.clear(); });
    }

    multi_select_ring deselect_many(const std::vector<int>& indices) const {
        return with_selection_([&](index_set& s) {
            for (int i : indices) {
                s.erase(this->normalize(i));
            }
        });
    }

    template <typename Pred>
    multi_select_ring deselect_many_matching(Pred&& pred) const {
        return with_selection_([&](index_set& s) {
            for (int i : boost::counting_range(0, this->size())) {
                if (pred(this->elements_[i])) {
                    s.erase(i);
                }
            }
        });
    }

    multi_select_ring toggle_at(int i) const {
        return is_selected_at(i) ? deselect_at(i) : select_at(i);
    }

    multi_select_ring toggle_first() const { return toggle_at(0); }

    multi_select_ring toggle_last() const { return toggle_at(this->size() - 1); }

    multi_select_ring toggle_focused() const { return toggle_at(this->focused_); }

    // Removes all selected elements, highest index first so that the remaining indices stay valid.
    multi_select_ring remove_selected() const {
        multi_select_ring ring = *this;
        for (auto it = selected_.rbegin(); it != selected_.rend(); ++it) {
            ring = ring.remove_at(*it);
        }
        return ring;
    }

    // Queries

    bool is_none_selected() const { return selected_.empty(); }

    bool is_any_selected() const { return !selected_.empty(); }

    bool is_all_selected() const { return count_selected() == this->size(); }

    bool is_selected_at(int i) const {
        return !this->is_empty() && selected_.count(this->normalize(i)) > 0;
    }

    bool is_focused_selected() const { return is_selected_at(this->focused_); }

    int count_selected() const { return size_of(selected_); }

    int count_deselected() const { return this->size() - count_selected(); }

    // Selected elements in ascending index order.
    std::vector<T> get_selected() const {
        auto out = std::vector<T>{};
        out.reserve(selected_.size());
        for (int i : selected_) {
            out.push_back(this->elements_[i]);
        }
        return out;
    }

    std::vector<int> get_selected_indices() const {
        return std::vector<int>(begin(selected_), end(selected_));
    }

    // Transformation

    template <typename F>
    auto map(F&& f) const -> multi_select_ring<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        return {this->template map_elements_<U>(f), this->focused_, selected_};
    }

    // Focus overrides selection: a focused element is passed to fun_focused even when selected.
    template <typename FBasic, typename FFocused, typename FSelected>
    auto map_each_into_array(FBasic&& fun_basic, FFocused&& fun_focused,
                             FSelected&& fun_selected) const
        -> std::vector<std::invoke_result_t<FBasic, const T&>> {
        using R = std::invoke_result_t<FBasic, const T&>;
        return this->template map_each_<std::vector<R>>([&](int i, const T& x) -> R {
            if (i == this->focused_) {
                return fun_focused(x);
            }
            if (selected_.count(i) > 0) {
                return fun_selected(x);
            }
            return fun_basic(x);
        });
    }

    template <typename FBasic, typename FFocused, typename FSelected>
    auto map_each_into_list(FBasic&& fun_basic, FFocused&& fun_focused,
                            FSelected&& fun_selected) const
        -> std::list<std::invoke_result_t<FBasic, const T&>> {
        return base::as_list_(map_each_into_array(fun_basic, fun_focused, fun_selected));
    }

    friend bool operator==(const multi_select_ring& a, const multi_select_ring& b) {
        return a.selected_ == b.selected_ && a.same_elements_and_focus_(b);
    }

    friend bool operator!=(const multi_select_ring& a, const multi_select_ring& b) {
        return !(a == b);
    }
};

}  // namespace rings

#endif  // RINGS_MULTI_SELECT_RING_HPP
