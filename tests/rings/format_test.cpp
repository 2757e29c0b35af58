// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "rings/format.hpp"

#include <sstream>
#include <string>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>

TEST_CASE("Text form of rings", "[format]") {
    SECTION("Focus ring marks the focused element") {
        auto r = rings::focus_ring<int>::from_array({1, 2, 3}).focus_on(1);
        CHECK(rings::to_string(r) == "{1, [2], 3}");
    }

    SECTION("Empty ring") {
        CHECK(rings::to_string(rings::focus_ring<int>::empty()) == "{}");
        CHECK(rings::to_string(rings::multi_select_ring<int>::empty()) == "{}");
    }

    SECTION("Select ring marks the selected element") {
        auto r = rings::select_ring<std::string>::from_array({"a", "b", "c"}).select_last();
        CHECK(rings::to_string(r) == "{[a], b, *c*}");
        CHECK(rings::to_string(r.focus_on_last()) == "{a, b, [*c*]}");
    }

    SECTION("Multi-select ring") {
        auto r = rings::multi_select_ring<char>::from_array({'a', 'b', 'c', 'd'})
                     .select_many({0, 2, 3})
                     .focus_on(2);
        CHECK(rings::to_string(r) == "{*a*, b, [*c*], *d*}");
    }

    SECTION("Zipper ring") {
        auto r = rings::zipper_ring<int>::from_list({1, 2, 3})->focus_on_last();
        CHECK(rings::to_string(r) == "{1, 2, [3]}");
    }

    SECTION("Formatting through fmt and streams") {
        auto r = rings::focus_ring<int>::from_array({4, 5}).focus_on_last();
        CHECK(fmt::format("ring: {}", r) == "ring: {4, [5]}");
        CHECK(fmt::format("{:>8}", r) == "{4, [5]}");

        std::ostringstream os;
        os << r;
        CHECK(os.str() == "{4, [5]}");
    }
}
