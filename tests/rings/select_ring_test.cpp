// SPDX-FileCopyrightText: 2015 - 2023 Marcin Łoś <marcin.los.91@gmail.com>
// SPDX-License-Identifier: MIT

#include "rings/select_ring.hpp"

#include <list>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

using Catch::Matchers::Equals;

using ring = rings::select_ring<char>;

namespace {

auto is(char c) {
    return [c](char x) { return x == c; };
}

}  // namespace

TEST_CASE("Select ring selection", "[select_ring]") {
    auto r = ring::from_array({'a', 'b', 'c', 'd'});

    SECTION("Nothing is selected initially") {
        CHECK(r.is_none_selected());
        CHECK_FALSE(r.is_any_selected());
        CHECK_FALSE(r.get_selected().has_value());
        CHECK_FALSE(r.get_selected_index().has_value());
    }

    SECTION("Select at normalizes the index") {
        auto s = r.select_at(-1);
        CHECK(s.is_any_selected());
        CHECK(s.get_selected_index() == 3);
        CHECK(s.get_selected() == 'd');
        CHECK(s.is_selected_at(3));
        CHECK(s.is_selected_at(-1));
        CHECK_FALSE(s.is_selected_at(0));
    }

    SECTION("Only the most recent selection survives") {
        auto s = r.select_at(0).select_at(2).select_last().select_at(1);
        CHECK(s.get_selected() == 'b');
        for (int i : {0, 2, 3}) {
            CHECK_FALSE(s.is_selected_at(i));
        }
    }

    SECTION("Selection is independent of the focus") {
        auto s = r.focus_on(2).select_at(0);
        CHECK(s.get_focused_index() == 2);
        CHECK(s.get_selected_index() == 0);

        auto t = s.focus_on_next();
        CHECK(t.get_selected_index() == 0);
    }

    SECTION("Select first, last and focused") {
        CHECK(r.select_first().get_selected_index() == 0);
        CHECK(r.select_last().get_selected_index() == 3);
        CHECK(r.focus_on(2).select_focused().get_selected_index() == 2);
    }

    SECTION("Select first and last matching") {
        auto s = ring::from_array({'x', 'y', 'x', 'y'});
        CHECK(s.select_first_matching(is('y')).get_selected_index() == 1);
        CHECK(s.select_last_matching(is('x')).get_selected_index() == 2);
        CHECK(s.select_at(3).select_first_matching(is('z')).get_selected_index() == 3);
    }

    SECTION("Clear") {
        CHECK(r.select_at(1).clear_selected().is_none_selected());
    }
}

TEST_CASE("Select ring deselection and toggling", "[select_ring]") {
    auto r = ring::from_array({'a', 'b', 'c'}).select_at(1);

    SECTION("Deselect only clears a matching index") {
        CHECK(r.deselect_at(0).get_selected_index() == 1);
        CHECK(r.deselect_at(1).is_none_selected());
        CHECK(r.deselect_at(4).is_none_selected());
    }

    SECTION("Deselect first, last and focused") {
        CHECK(r.deselect_first() == r);
        CHECK(r.deselect_last() == r);
        CHECK(r.focus_on(1).deselect_focused().is_none_selected());
        CHECK(r.select_first().deselect_first().is_none_selected());
        CHECK(r.select_last().deselect_last().is_none_selected());
    }

    SECTION("Deselect matching tests the selected value") {
        CHECK(r.deselect_matching(is('b')).is_none_selected());
        CHECK(r.deselect_matching(is('a')).get_selected_index() == 1);
    }

    SECTION("Toggle flips the selection of an index") {
        CHECK(r.toggle_at(1).is_none_selected());
        CHECK(r.toggle_at(2).get_selected_index() == 2);
        CHECK(r.toggle_at(2).toggle_at(2).is_none_selected());
        CHECK(r.toggle_first().get_selected_index() == 0);
        CHECK(r.toggle_last().get_selected_index() == 2);
        CHECK(r.focus_on(1).toggle_focused().is_none_selected());
    }

    SECTION("Selection predicates") {
        CHECK(r.is_selected_matching(is('b')));
        CHECK_FALSE(r.is_selected_matching(is('c')));
        CHECK_FALSE(r.clear_selected().is_selected_matching(is('b')));
    }

    SECTION("Set selected replaces the selected element") {
        auto s = r.set_selected('z');
        CHECK_THAT(s.to_array(), Equals(std::vector<char>{'a', 'z', 'c'}));
        CHECK(r.clear_selected().set_selected('z') == r.clear_selected());
    }
}

TEST_CASE("Select ring structural changes", "[select_ring]") {
    auto r = ring::from_array({'a', 'b', 'c', 'd'});

    SECTION("Removing the selected element clears the selection") {
        auto s = r.select_at(2).remove_at(2);
        CHECK(s.is_none_selected());
    }

    SECTION("Removing an earlier element shifts the selection down") {
        auto s = r.select_at(2).remove_at(0);
        CHECK(s.get_selected_index() == 1);
        CHECK(s.get_selected() == 'c');
    }

    SECTION("Removing a later element keeps the selection") {
        auto s = r.select_at(1).remove_last();
        CHECK(s.get_selected_index() == 1);
        CHECK(s.get_selected() == 'b');
    }

    SECTION("Removal adjusts the focus as in a plain focus ring") {
        auto s = r.focus_on_last().select_at(0).remove_last();
        CHECK(s.get_focused_index() == 2);
        CHECK(s.get_selected_index() == 0);
    }

    SECTION("Remove selected") {
        auto s = r.select_at(1).remove_selected();
        CHECK_THAT(s.to_array(), Equals(std::vector<char>{'a', 'c', 'd'}));
        CHECK(s.is_none_selected());
        CHECK(r.remove_selected() == r);
    }

    SECTION("Prepend shifts the selection with the focus") {
        auto s = r.focus_on(1).select_at(3).prepend({'x', 'y'});
        CHECK(s.get_focused() == 'b');
        CHECK(s.get_selected() == 'd');
        CHECK(s.get_selected_index() == 5);
    }

    SECTION("Removing the only element leaves a valid empty ring") {
        auto s = ring::singleton('a').select_first().remove_first();
        CHECK(s.is_empty());
        CHECK(s.is_none_selected());
        CHECK(s.get_focused_index() == 0);
    }
}

TEST_CASE("Select ring mapping", "[select_ring]") {
    auto basic = [](char c) { return std::string(1, c); };
    auto focused = [](char c) { return "[" + std::string(1, c) + "]"; };
    auto selected = [](char c) { return "*" + std::string(1, c) + "*"; };

    SECTION("Three-way dispatch") {
        auto r = ring::from_array({'a', 'b', 'c'}).focus_on(0).select_at(2);
        CHECK_THAT(r.map_each_into_array(basic, focused, selected),
                   Equals(std::vector<std::string>{"[a]", "b", "*c*"}));
        CHECK(r.map_each_into_list(basic, focused, selected)
              == std::list<std::string>{"[a]", "b", "*c*"});
    }

    SECTION("Focus wins over selection") {
        auto r = ring::from_array({'a', 'b', 'c'}).focus_on(1).select_at(1);
        CHECK_THAT(r.map_each_into_array(basic, focused, selected),
                   Equals(std::vector<std::string>{"a", "[b]", "c"}));
    }

    SECTION("Map keeps focus and selection") {
        auto r = ring::from_array({'a', 'b', 'c'}).focus_on(1).select_at(2);
        auto s = r.map([](char c) { return int(c - 'a'); });
        CHECK_THAT(s.to_array(), Equals(std::vector<int>{0, 1, 2}));
        CHECK(s.get_focused_index() == 1);
        CHECK(s.get_selected_index() == 2);
    }
}

TEST_CASE("Select ring operations on an empty ring", "[select_ring]") {
    auto r = ring::empty();

    CHECK_FALSE(r.get_selected().has_value());
    CHECK_FALSE(r.is_selected_at(0));
    CHECK_FALSE(r.is_selected_matching(is('a')));

    CHECK(r.select_at(3).is_empty());
    CHECK(r.select_at(3).is_none_selected());
    CHECK(r.select_first().is_none_selected());
    CHECK(r.select_last().is_none_selected());
    CHECK(r.select_focused().is_none_selected());
    CHECK(r.select_first_matching(is('a')).is_none_selected());
    CHECK(r.toggle_at(0).is_none_selected());
    CHECK(r.toggle_focused().is_empty());
    CHECK(r.deselect_at(0).is_empty());
    CHECK(r.remove_selected().is_empty());
    CHECK(r.set_selected('a').is_empty());
}
