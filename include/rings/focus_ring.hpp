// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_FOCUS_RING_HPP
#define RINGS_FOCUS_RING_HPP

#include <list>
#include <type_traits>
#include <utility>
#include <vector>

#include "rings/detail/ring_base.hpp"

namespace rings {

// Ordered sequence with a single focus cursor that wraps around at both ends.
//
// All operations leave the ring untouched and return a modified copy. Indices passed in are
// reduced modulo size(), and operations on an empty ring are no-ops (accessors yield nullopt).
template <typename T>
class focus_ring : public detail::ring_base<T, focus_ring<T>> {
private:
    using base = detail::ring_base<T, focus_ring<T>>;

    template <typename>
    friend class focus_ring;

    focus_ring(std::vector<T> elements, int focused)
    : base{std::move(elements), focused} { }

public:
    focus_ring() = default;

    static focus_ring empty() { return {}; }

    static focus_ring singleton(T x) {
        auto elements = std::vector<T>{};
        elements.push_back(std::move(x));
        return {std::move(elements), 0};
    }

    static focus_ring from_array(std::vector<T> items) { return {std::move(items), 0}; }

    static focus_ring from_list(const std::list<T>& items) {
        return {std::vector<T>(begin(items), end(items)), 0};
    }

    template <typename F>
    auto map(F&& f) const -> focus_ring<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        return {this->template map_elements_<U>(f), this->focused_};
    }

    // fun_focused is applied to the focused element, fun_basic to every other one.
    template <typename FBasic, typename FFocused>
    auto map_each_into_array(FBasic&& fun_basic, FFocused&& fun_focused) const
        -> std::vector<std::invoke_result_t<FBasic, const T&>> {
        using R = std::invoke_result_t<FBasic, const T&>;
        return this->template map_each_<std::vector<R>>([&](int i, const T& x) -> R {
            if (i == this->focused_) {
                return fun_focused(x);
            }
            return fun_basic(x);
        });
    }

    template <typename FBasic, typename FFocused>
    auto map_each_into_list(FBasic&& fun_basic, FFocused&& fun_focused) const
        -> std::list<std::invoke_result_t<FBasic, const T&>> {
        return base::as_list_(map_each_into_array(fun_basic, fun_focused));
    }

    friend bool operator==(const focus_ring& a, const focus_ring& b) {
        return a.same_elements_and_focus_(b);
    }

    friend bool operator!=(const focus_ring& a, const focus_ring& b) { return !(a == b); }
};

}  // namespace rings

#endif  // RINGS_FOCUS_RING_HPP
