// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_UTIL_HPP
#define RINGS_UTIL_HPP

#include <utility>

namespace rings {

template <typename T, typename U>
constexpr T narrow_cast(U&& u) noexcept {
    return static_cast<T>(std::forward<U>(u));
}

template <typename Cont>
int size_of(const Cont& cont) {
    return narrow_cast<int>(cont.size());
}

}  // namespace rings

#endif  // RINGS_UTIL_HPP
