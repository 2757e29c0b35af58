// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_SELECT_RING_HPP
#define RINGS_SELECT_RING_HPP

#include <list>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "rings/detail/ring_base.hpp"
#include "rings/util/index.hpp"

namespace rings {

// Focus ring with at most one selected element. Selection is independent of focus: the two may
// point at the same element or at different ones.
template <typename T>
class select_ring : public detail::ring_base<T, select_ring<T>> {
private:
    using base = detail::ring_base<T, select_ring<T>>;

    friend base;

    template <typename>
    friend class select_ring;

    std::optional<int> selected_;

    select_ring(std::vector<T> elements, int focused, std::optional<int> selected)
    : base{std::move(elements), focused}
    , selected_{selected} { }

    void after_prepend_(int count) {
        if (selected_) {
            *selected_ += count;
        }
    }

    void after_remove_(int index) {
        if (!selected_) {
            return;
        }
        if (*selected_ == index) {
            selected_.reset();
        } else if (*selected_ > index) {
            --*selected_;
        }
    }

    select_ring with_selection_(std::optional<int> selected) const {
        select_ring ring = *this;
        ring.selected_ = selected;
        return ring;
    }

public:
    select_ring() = default;

    static select_ring empty() { return {}; }

    static select_ring singleton(T x) {
        auto elements = std::vector<T>{};
        elements.push_back(std::move(x));
        return {std::move(elements), 0, std::nullopt};
    }

    static select_ring from_array(std::vector<T> items) {
        return {std::move(items), 0, std::nullopt};
    }

    static select_ring from_list(const std::list<T>& items) {
        return {std::vector<T>(begin(items), end(items)), 0, std::nullopt};
    }

    // Selection

    select_ring select_at(int i) const {
        if (this->is_empty()) {
            return *this;
        }
        return with_selection_(this->normalize(i));
    }

    select_ring select_first() const { return select_at(0); }

    select_ring select_last() const { return select_at(this->size() - 1); }

    select_ring select_focused() const { return select_at(this->focused_); }

    template <typename Pred>
    select_ring select_first_matching(Pred&& pred) const {
        auto index = util::find_first_index(this->elements_, pred);
        return index ? with_selection_(index) : *this;
    }

    template <typename Pred>
    select_ring select_last_matching(Pred&& pred) const {
        auto index = util::find_last_index(this->elements_, pred);
        return index ? with_selection_(index) : *this;
    }

    select_ring clear_selected() const { return with_selection_(std::nullopt); }

    select_ring deselect_at(int i) const {
        return is_selected_at(i) ? clear_selected() : *this;
    }

    select_ring deselect_first() const { return deselect_at(0); }

    select_ring deselect_last() const { return deselect_at(this->size() - 1); }

    select_ring deselect_focused() const { return deselect_at(this->focused_); }

    template <typename Pred>
    select_ring deselect_matching(Pred&& pred) const {
        return is_selected_matching(pred) ? clear_selected() : *this;
    }

    select_ring toggle_at(int i) const {
        return is_selected_at(i) ? clear_selected() : select_at(i);
    }

    select_ring toggle_first() const { return toggle_at(0); }

    select_ring toggle_last() const { return toggle_at(this->size() - 1); }

    select_ring toggle_focused() const { return toggle_at(this->focused_); }

    select_ring remove_selected() const {
        return selected_ ? this->remove_at(*selected_) : *this;
    }

    // Queries

    bool is_none_selected() const { return !selected_.has_value(); }

    bool is_any_selected() const { return selected_.has_value(); }

    bool is_selected_at(int i) const {
        return !this->is_empty() && selected_ == this->normalize(i);
    }

    template <typename Pred>
    bool is_selected_matching(Pred&& pred) const {
        return selected_ && pred(this->elements_[*selected_]);
    }

    std::optional<T> get_selected() const {
        if (!selected_) {
            return {};
        }
        return this->elements_[*selected_];
    }

    std::optional<int> get_selected_index() const { return selected_; }

    select_ring set_selected(T x) const {
        return selected_ ? this->set(*selected_, std::move(x)) : *this;
    }

    // Transformation

    template <typename F>
    auto map(F&& f) const -> select_ring<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        return {this->template map_elements_<U>(f), this->focused_, selected_};
    }

    // Focus takes priority: an element that is both focused and selected goes through fun_focused.
    template <typename FBasic, typename FFocused, typename FSelected>
    auto map_each_into_array(FBasic&& fun_basic, FFocused&& fun_focused,
                             FSelected&& fun_selected) const
        -> std::vector<std::invoke_result_t<FBasic, const T&>> {
        using R = std::invoke_result_t<FBasic, const T&>;
        return this->template map_each_<std::vector<R>>([&](int i, const T& x) -> R {
            if (i == this->focused_) {
                return fun_focused(x);
            }
            if (selected_ == i) {
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

    friend bool operator==(const select_ring& a, const select_ring& b) {
        return a.selected_ == b.selected_ && a.same_elements_and_focus_(b);
    }

    friend bool operator!=(const select_ring& a, const select_ring& b) { return !(a == b); }
};

}  // namespace rings

#endif  // RINGS_SELECT_RING_HPP
