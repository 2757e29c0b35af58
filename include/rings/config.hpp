// SPDX-FileCopyrightText: 2015 - 2021 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#ifndef RINGS_CONFIG_HPP
#define RINGS_CONFIG_HPP

#include <string_view>

namespace rings {

struct version_info {
    std::string_view core;
    std::string_view commit;
    std::string_view full;
    int major;
    int minor;
    int patch;
};

auto version() -> version_info;

}  // namespace rings

#endif  // RINGS_CONFIG_HPP
