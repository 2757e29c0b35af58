// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_FORMAT_HPP
#define RINGS_FORMAT_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "rings/focus_ring.hpp"
#include "rings/multi_select_ring.hpp"
#include "rings/select_ring.hpp"
#include "rings/zipper_ring.hpp"

// Text form of the rings, used for diagnostics and by the trace tool:
//
//   {a, [b], *c*, d}      b focused, c selected
//   {a, [*b*], c}         b focused and selected
//
// Elements have to be formattable with {fmt}.

namespace rings {

namespace impl {

inline std::string join_elements(const std::vector<std::string>& parts) {
    return fmt::format("{{{}}}", fmt::join(parts, ", "));
}

template <typename T>
std::string plain(const T& x) {
    return fmt::format("{}", x);
}

template <typename T>
std::string focused(const T& x, bool selected) {
    return selected ? fmt::format("[*{}*]", x) : fmt::format("[{}]", x);
}

template <typename T>
std::string selected(const T& x) {
    return fmt::format("*{}*", x);
}

}  // namespace impl

template <typename T>
std::string to_string(const focus_ring<T>& ring) {
    return impl::join_elements(ring.map_each_into_array(  //
        [](const T& x) { return impl::plain(x); },
        [](const T& x) { return impl::focused(x, false); }));
}

template <typename T>
std::string to_string(const select_ring<T>& ring) {
    const bool focused_selected = ring.is_selected_at(ring.get_focused_index());
    return impl::join_elements(ring.map_each_into_array(  //
        [](const T& x) { return impl::plain(x); },
        [&](const T& x) { return impl::focused(x, focused_selected); },
        [](const T& x) { return impl::selected(x); }));
}

template <typename T>
std::string to_string(const multi_select_ring<T>& ring) {
    const bool focused_selected = ring.is_focused_selected();
    return impl::join_elements(ring.map_each_into_array(  //
        [](const T& x) { return impl::plain(x); },
        [&](const T& x) { return impl::focused(x, focused_selected); },
        [](const T& x) { return impl::selected(x); }));
}

template <typename T>
std::string to_string(const zipper_ring<T>& ring) {
    return impl::join_elements(ring.map_each_into_array(  //
        [](const T& x) { return impl::plain(x); },
        [](const T& x) { return impl::focused(x, false); }));
}

template <typename T>
std::ostream& operator<<(std::ostream& os, const focus_ring<T>& ring) {
    return os << to_string(ring);
}

template <typename T>
std::ostream& operator<<(std::ostream& os, const select_ring<T>& ring) {
    return os << to_string(ring);
}

template <typename T>
std::ostream& operator<<(std::ostream& os, const multi_select_ring<T>& ring) {
    return os << to_string(ring);
}

template <typename T>
std::ostream& operator<<(std::ostream& os, const zipper_ring<T>& ring) {
    return os << to_string(ring);
}

template <typename Ring>
struct ring_formatter : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const Ring& ring, FormatContext& ctx) const -> decltype(ctx.out()) {
        const auto text = to_string(ring);
        return fmt::formatter<std::string_view>::format(text, ctx);
    }
};

}  // namespace rings

template <typename T>
struct fmt::formatter<rings::focus_ring<T>> : rings::ring_formatter<rings::focus_ring<T>> { };

template <typename T>
struct fmt::formatter<rings::select_ring<T>> : rings::ring_formatter<rings::select_ring<T>> { };

template <typename T>
struct fmt::formatter<rings::multi_select_ring<T>>
  : rings::ring_formatter<rings::multi_select_ring<T>> { };

template <typename T>
struct fmt::formatter<rings::zipper_ring<T>> : rings::ring_formatter<rings::zipper_ring<T>> { };

#endif  // RINGS_FORMAT_HPP
