// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_ZIPPER_RING_HPP
#define RINGS_ZIPPER_RING_HPP

#include <deque>
#include <initializer_list>
#include <list>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "rings/util.hpp"

namespace rings {

// Non-empty ring stored as a zipper: the focused element, the elements before it (nearest
// first) and the elements after it. Stepping the focus is O(1), indexed access is not offered.
//
// Logical order is reverse(left) ++ [focused] ++ right.
template <typename T>
class zipper_ring {
private:
    template <typename>
    friend class zipper_ring;

    std::deque<T> left_;
    T focused_;
    std::deque<T> right_;

    zipper_ring(std::deque<T> left, T focused, std::deque<T> right)
    : left_{std::move(left)}
    , focused_{std::move(focused)}
    , right_{std::move(right)} { }

    template <typename Cont>
    static std::optional<zipper_ring> from_sequence_(const Cont& items) {
        if (items.size() == 0) {
            return {};
        }
        auto it = begin(items);
        T focused = *it;
        return zipper_ring{{}, std::move(focused), std::deque<T>(++it, end(items))};
    }

    // Walks forward from the element after the focus until pred holds, giving up once the
    // configuration comes back to where it started.
    template <typename Pred>
    std::optional<zipper_ring> scan_forward_(Pred&& pred) const {
        for (auto ring = focus_on_next(); ring != *this; ring = ring.focus_on_next()) {
            if (pred(ring.focused_)) {
                return ring;
            }
        }
        return {};
    }

    template <typename Pred>
    std::optional<zipper_ring> scan_backward_(Pred&& pred) const {
        for (auto ring = focus_on_previous(); ring != *this; ring = ring.focus_on_previous()) {
            if (pred(ring.focused_)) {
                return ring;
            }
        }
        return {};
    }

public:
    using value_type = T;

    static zipper_ring singleton(T x) { return {{}, std::move(x), {}}; }

    template <typename Cont>
    static std::optional<zipper_ring> from_list(const Cont& items) {
        return from_sequence_(items);
    }

    static std::optional<zipper_ring> from_list(std::initializer_list<T> items) {
        return from_sequence_(items);
    }

    template <typename Cont>
    static zipper_ring from_list_with_default(T def, const Cont& items) {
        auto ring = from_sequence_(items);
        return ring ? *std::move(ring) : singleton(std::move(def));
    }

    static zipper_ring from_list_with_default(T def, std::initializer_list<T> items) {
        auto ring = from_sequence_(items);
        return ring ? *std::move(ring) : singleton(std::move(def));
    }

    int size() const { return size_of(left_) + 1 + size_of(right_); }

    T get_focused() const { return focused_; }

    // Structure

    zipper_ring push(T x) const {
        zipper_ring ring = *this;
        ring.right_.push_back(std::move(x));
        return ring;
    }

    zipper_ring append(T x) const { return push(std::move(x)); }

    zipper_ring prepend(T x) const {
        zipper_ring ring = *this;
        ring.left_.push_back(std::move(x));
        return ring;
    }

    // Navigation

    zipper_ring focus_on_first() const {
        if (left_.empty()) {
            return *this;
        }
        // left_.back() is the first element, the rest of left_ lies between it and the focus
        auto right = std::deque<T>(left_.rbegin() + 1, left_.rend());
        right.push_back(focused_);
        right.insert(right.end(), right_.begin(), right_.end());
        return {{}, left_.back(), std::move(right)};
    }

    zipper_ring focus_on_last() const {
        if (right_.empty()) {
            return *this;
        }
        auto left = std::deque<T>(right_.rbegin() + 1, right_.rend());
        left.push_back(focused_);
        left.insert(left.end(), left_.begin(), left_.end());
        return {std::move(left), right_.back(), {}};
    }

    zipper_ring focus_on_next() const {
        if (right_.empty()) {
            return focus_on_first();
        }
        zipper_ring ring = *this;
        ring.left_.push_front(std::move(ring.focused_));
        ring.focused_ = std::move(ring.right_.front());
        ring.right_.pop_front();
        return ring;
    }

    zipper_ring focus_on_previous() const {
        if (left_.empty()) {
            return focus_on_last();
        }
        zipper_ring ring = *this;
        ring.right_.push_front(std::move(ring.focused_));
        ring.focused_ = std::move(ring.left_.front());
        ring.left_.pop_front();
        return ring;
    }

    template <typename Pred>
    std::optional<zipper_ring> focus_on_first_matching(Pred&& pred) const {
        auto first = focus_on_first();
        if (pred(first.focused_)) {
            return first;
        }
        return first.scan_forward_(pred);
    }

    template <typename Pred>
    std::optional<zipper_ring> focus_on_last_matching(Pred&& pred) const {
        auto last = focus_on_last();
        if (pred(last.focused_)) {
            return last;
        }
        return last.scan_backward_(pred);
    }

    // The current focus is not a candidate. Cycle detection compares the whole zipper rather than
    // the focused value, so repeated values elsewhere in the ring are still visited.
    template <typename Pred>
    std::optional<zipper_ring> focus_on_next_matching(Pred&& pred) const {
        return scan_forward_(pred);
    }

    template <typename Pred>
    std::optional<zipper_ring> focus_on_previous_matching(Pred&& pred) const {
        return scan_backward_(pred);
    }

    // Access

    std::list<T> to_list() const {
        auto out = std::list<T>(left_.rbegin(), left_.rend());
        out.push_back(focused_);
        out.insert(out.end(), right_.begin(), right_.end());
        return out;
    }

    std::vector<T> to_array() const {
        auto out = std::vector<T>(left_.rbegin(), left_.rend());
        out.push_back(focused_);
        out.insert(out.end(), right_.begin(), right_.end());
        return out;
    }

    // Transformation

    template <typename F>
    auto map(F&& f) const -> zipper_ring<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        auto convert = [&f](const std::deque<T>& xs) {
            auto out = std::deque<U>{};
            for (const auto& x : xs) {
                out.push_back(f(x));
            }
            return out;
        };
        return {convert(left_), f(focused_), convert(right_)};
    }

    template <typename F>
    zipper_ring map_focused(F&& f) const {
        zipper_ring ring = *this;
        ring.focused_ = f(focused_);
        return ring;
    }

    template <typename FBasic, typename FFocused>
    auto map_each_into_array(FBasic&& fun_basic, FFocused&& fun_focused) const
        -> std::vector<std::invoke_result_t<FBasic, const T&>> {
        auto out = std::vector<std::invoke_result_t<FBasic, const T&>>{};
        out.reserve(size());
        for (auto it = left_.rbegin(); it != left_.rend(); ++it) {
            out.push_back(fun_basic(*it));
        }
        out.push_back(fun_focused(focused_));
        for (const auto& x : right_) {
            out.push_back(fun_basic(x));
        }
        return out;
    }

    friend bool operator==(const zipper_ring& a, const zipper_ring& b) {
        return a.focused_ == b.focused_ && a.left_ == b.left_ && a.right_ == b.right_;
    }

    friend bool operator!=(const zipper_ring& a, const zipper_ring& b) { return !(a == b); }
};

}  // namespace rings

#endif  // RINGS_ZIPPER_RING_HPP
